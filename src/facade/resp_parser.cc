// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "facade/resp_parser.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

extern "C" {
#include <hiredis/hiredis.h>
}

using namespace std;

namespace facade {

RespExpr FromRedisReply(const redisReply* reply) {
  DCHECK(reply);

  switch (reply->type) {
    case REDIS_REPLY_STRING:
    case REDIS_REPLY_STATUS:
    case REDIS_REPLY_VERB:
    case REDIS_REPLY_BIGNUM:
      return RespExpr::String(string_view{reply->str, reply->len});
    case REDIS_REPLY_ERROR:
      return RespExpr::Error(string_view{reply->str, reply->len});
    case REDIS_REPLY_INTEGER:
    case REDIS_REPLY_BOOL:
      return RespExpr::Int(reply->integer);
    case REDIS_REPLY_DOUBLE:
      return RespExpr::Double(reply->dval);
    case REDIS_REPLY_NIL:
      return RespExpr::Nil();
    case REDIS_REPLY_ARRAY:
    case REDIS_REPLY_MAP:
    case REDIS_REPLY_SET:
    case REDIS_REPLY_PUSH: {
      RespVec vec;
      vec.reserve(reply->elements);
      for (size_t i = 0; i < reply->elements; ++i) {
        vec.push_back(FromRedisReply(reply->element[i]));
      }
      return RespExpr::Array(std::move(vec));
    }
  }

  LOG(DFATAL) << "Unsupported reply type " << reply->type;
  return RespExpr::Error("ERR unsupported reply type");
}

string SerializeCommand(CmdArgList args) {
  string res = absl::StrCat("*", args.size(), "\r\n");
  for (string_view arg : args) {
    absl::StrAppend(&res, "$", arg.size(), "\r\n", arg, "\r\n");
  }
  return res;
}

RESPParser::RESPParser() : reader_(redisReaderCreate()) {
  CHECK(reader_) << "Out of memory";
}

RESPParser::~RESPParser() {
  redisReaderFree(reader_);
}

OpResult<optional<RespExpr>> RESPParser::Feed(string_view data) {
  if (!data.empty()) {  // with no new data we check whether buffered input holds a reply
    if (redisReaderFeed(reader_, data.data(), data.size()) != REDIS_OK) {
      LOG(ERROR) << "RESP parser error: " << reader_->errstr;
      return OpStatus::INVALID_VALUE;
    }
  }

  void* reply_obj = nullptr;
  if (redisReaderGetReply(reader_, &reply_obj) != REDIS_OK) {
    LOG(ERROR) << "RESP parser error: " << reader_->errstr << " data: " << data;
    return OpStatus::INVALID_VALUE;
  }

  if (!reply_obj)
    return optional<RespExpr>{};

  optional<RespExpr> res{FromRedisReply(static_cast<redisReply*>(reply_obj))};
  freeReplyObject(reply_obj);
  return res;
}

}  // namespace facade
