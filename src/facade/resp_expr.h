// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/types/span.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "facade/facade_types.h"

namespace facade {

// Owned reply value as returned by a node. Arrays nest.
class RespExpr {
 public:
  enum Type : uint8_t { STRING, ARRAY, INT64, DOUBLE, NIL, NIL_ARRAY, ERROR };

  using Vec = std::vector<RespExpr>;
  Type type;

  std::variant<int64_t, double, std::string, Vec> u;

  RespExpr(Type t = NIL) : type(t) {
  }

  static RespExpr String(std::string_view s);
  static RespExpr Error(std::string_view s);
  static RespExpr Int(int64_t val);
  static RespExpr Double(double val);
  static RespExpr Array(Vec vec);
  static RespExpr StringArray(absl::Span<const std::string> strs);

  static RespExpr Nil() {
    return RespExpr{NIL};
  }

  static RespExpr NilArray() {
    return RespExpr{NIL_ARRAY};
  }

  static RespExpr Ok() {
    return String("OK");
  }

  std::string_view GetView() const {
    return std::get<std::string>(u);
  }

  std::string GetString() const {
    return std::get<std::string>(u);
  }

  const Vec& GetVec() const {
    return std::get<Vec>(u);
  }

  Vec& GetVec() {
    return std::get<Vec>(u);
  }

  std::optional<int64_t> GetInt() const {
    return type == INT64 ? std::make_optional(std::get<int64_t>(u)) : std::nullopt;
  }

  bool IsError() const {
    return type == ERROR;
  }

  // NIL and NIL_ARRAY are both "no value" replies.
  bool IsNil() const {
    return type == NIL || type == NIL_ARRAY;
  }

  bool IsOkString() const {
    return type == STRING && GetView() == "OK";
  }

  bool operator==(const RespExpr& o) const {
    return type == o.type && u == o.u;
  }

  bool operator!=(const RespExpr& o) const {
    return !(*this == o);
  }

  static const char* TypeName(Type t);
};

using RespVec = RespExpr::Vec;
using RespSpan = absl::Span<const RespExpr>;

}  // namespace facade

namespace std {

ostream& operator<<(ostream& os, const facade::RespExpr& e);
ostream& operator<<(ostream& os, facade::RespSpan rspan);

}  // namespace std
