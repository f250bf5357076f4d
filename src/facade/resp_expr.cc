// Copyright 2023, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "facade/resp_expr.h"

#include <absl/strings/escaping.h>

namespace facade {

RespExpr RespExpr::String(std::string_view s) {
  RespExpr e{STRING};
  e.u = std::string(s);
  return e;
}

RespExpr RespExpr::Error(std::string_view s) {
  RespExpr e{ERROR};
  e.u = std::string(s);
  return e;
}

RespExpr RespExpr::Int(int64_t val) {
  RespExpr e{INT64};
  e.u = val;
  return e;
}

RespExpr RespExpr::Double(double val) {
  RespExpr e{DOUBLE};
  e.u = val;
  return e;
}

RespExpr RespExpr::Array(Vec vec) {
  RespExpr e{ARRAY};
  e.u = std::move(vec);
  return e;
}

RespExpr RespExpr::StringArray(absl::Span<const std::string> strs) {
  Vec vec;
  vec.reserve(strs.size());
  for (const auto& s : strs)
    vec.push_back(String(s));
  return Array(std::move(vec));
}

const char* RespExpr::TypeName(Type t) {
  switch (t) {
    case STRING:
      return "string";
    case INT64:
      return "int";
    case DOUBLE:
      return "double";
    case ARRAY:
      return "array";
    case NIL_ARRAY:
      return "nil-array";
    case NIL:
      return "nil";
    case ERROR:
      return "error";
  }
  return "unknown";
}

}  // namespace facade

namespace std {

ostream& operator<<(ostream& os, const facade::RespExpr& e) {
  using facade::RespExpr;

  switch (e.type) {
    case RespExpr::INT64:
      os << "i" << get<int64_t>(e.u);
      break;
    case RespExpr::DOUBLE:
      os << "d" << get<double>(e.u);
      break;
    case RespExpr::STRING:
      os << "'" << absl::CHexEscape(e.GetView()) << "'";
      break;
    case RespExpr::NIL:
      os << "nil";
      break;
    case RespExpr::NIL_ARRAY:
      os << "[]";
      break;
    case RespExpr::ARRAY:
      os << facade::RespSpan{e.GetVec()};
      break;
    case RespExpr::ERROR:
      os << "e(" << e.GetView() << ")";
      break;
  }

  return os;
}

ostream& operator<<(ostream& os, facade::RespSpan ras) {
  os << "[";
  if (!ras.empty()) {
    for (size_t i = 0; i < ras.size() - 1; ++i) {
      os << ras[i] << ",";
    }
    os << ras.back();
  }
  os << "]";

  return os;
}

}  // namespace std
