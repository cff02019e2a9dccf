/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <cmath>
#include <cstring>

#include <map>
#include <string>
#include <type_traits>
#include <vector>

#include <logging/Checks.h>

#include <reshard/helpers/Serialization.h>

namespace reshard {

using std::is_floating_point;
using std::is_integral;
using std::is_same;
using std::is_signed;
using std::map;
using std::string;
using std::vector;

/// rapidjson::Document's default MemoryPoolAllocator crashes on some platforms
/// as documented in https://github.com/cocos2d/cocos2d-x/issues/16492
using JUtf8Encoding = reshard_rapidjson::UTF8<>;
using JCrtAllocator = reshard_rapidjson::CrtAllocator;
using JDocument = reshard_rapidjson::GenericDocument<JUtf8Encoding, JCrtAllocator>;
using JValue = reshard_rapidjson::GenericValue<JUtf8Encoding, JCrtAllocator>;
using JStringRef = reshard_rapidjson::GenericStringRef<char>;

static inline JStringRef jStringRef(const char* str) {
  return JStringRef(str, strlen(str));
}
static inline JStringRef jStringRef(const string& str) {
  return JStringRef(str.c_str(), str.size());
}

/// Parse a json string. Returns false if the text isn't valid json.
template <class T>
static inline bool jParse(JDocument& document, const T& str) {
  document.Parse(str.data(), str.size());
  return !document.HasParseError();
}

static inline string jParseErrorMessage(const JDocument& document) {
  return string(reshard_rapidjson::GetParseError_En(document.GetParseError())) + " at offset " +
      std::to_string(document.GetErrorOffset());
}

/// Helper class to generate json messages using RapidJson.
struct JsonWrapper {
  explicit JsonWrapper(JDocument& doc) : value{doc}, alloc{doc.GetAllocator()} {
    doc.SetObject();
  }
  JsonWrapper(JValue& v, JDocument::AllocatorType& a) : value{v}, alloc{a} {}

  JValue& value;
  JDocument::AllocatorType& alloc;

  template <typename T>
  inline JValue jValue(const T& v) {
    return JValue(v);
  }

  template <typename T>
  inline JValue jValue(const vector<T>& vect) {
    JValue jv(reshard_rapidjson::kArrayType);
    jv.Reserve(static_cast<reshard_rapidjson::SizeType>(vect.size()), alloc);
    for (const auto& v : vect) {
      jv.PushBack(jValue(v), alloc);
    }
    return jv;
  }

  template <typename JSTR>
  inline void addMember(const JSTR& name, JValue& v) {
    value.AddMember(jStringRef(name), v, alloc);
  }

  template <typename JSTR>
  inline void addMember(const JSTR& name, const char* str) {
    value.AddMember(jStringRef(name), jStringRef(str), alloc);
  }

  template <typename JSTR, typename T>
  inline void addMember(const JSTR& name, const T& v) {
    value.AddMember(jStringRef(name), jValue(v), alloc);
  }

  /// Add a member whose name doesn't outlive the json document.
  template <typename T>
  inline void addMemberCopy(const string& name, const T& v) {
    value.AddMember(jValue(name), jValue(v), alloc);
  }
};

template <>
inline JValue JsonWrapper::jValue<string>(const string& str) {
  JValue jstring;
  jstring.SetString(str.c_str(), static_cast<reshard_rapidjson::SizeType>(str.length()), alloc);
  return jstring;
}

template <typename T, typename JSTR>
inline void serializeVector(const vector<T>& vect, JsonWrapper& rj, const JSTR& name) {
  using namespace reshard_rapidjson;
  JValue arrayValues(kArrayType);
  arrayValues.Reserve(static_cast<SizeType>(vect.size()), rj.alloc);
  for (const auto& element : vect) {
    arrayValues.PushBack(rj.jValue(element), rj.alloc);
  }
  rj.addMember(name, arrayValues);
}

// when the vector<string> will live as long as the json serialization (avoid string copies)
template <typename JSTR>
inline void
serializeStringRefVector(const vector<string>& vect, JsonWrapper& rj, const JSTR& name) {
  using namespace reshard_rapidjson;
  JValue arrayValues(kArrayType);
  arrayValues.Reserve(static_cast<SizeType>(vect.size()), rj.alloc);
  for (const auto& str : vect) {
    arrayValues.PushBack(jStringRef(str), rj.alloc);
  }
  rj.addMember(name, arrayValues);
}

template <typename JSON_TYPE, typename OUT_TYPE>
inline bool getJValueAs(const JValue& value, OUT_TYPE& outValue) {
  if (value.Is<JSON_TYPE>()) {
    JSON_TYPE jsonValue = value.Get<JSON_TYPE>();
    outValue = static_cast<OUT_TYPE>(jsonValue);
    return true;
  }
  return false;
}

template <typename T>
inline bool getFromJValue(const JValue& value, T& outValue) {
  if (is_floating_point<T>::value) {
    return getJValueAs<double, T>(value, outValue) || getJValueAs<int64_t, T>(value, outValue);
  }
  if (is_integral<T>::value) {
    if (is_signed<T>::value) {
      return getJValueAs<int, T>(value, outValue) || getJValueAs<int64_t, T>(value, outValue);
    } else {
      return getJValueAs<unsigned, T>(value, outValue) || getJValueAs<uint64_t, T>(value, outValue);
    }
  }
  RS_CHECK(false, "This type is not some number: you need to implement a specialized version");
  return false;
}

template <>
inline bool getFromJValue(const JValue& value, string& outValue) {
  if (value.IsString()) {
    outValue = value.GetString();
    return true;
  }
  return false;
}

/// Read an array member. Returns false if the member is missing, isn't an array,
/// or one of its elements doesn't have the expected type.
template <typename T, typename JSTR>
inline bool getJVector(vector<T>& outVector, const JValue& piece, const JSTR& name) {
  using namespace reshard_rapidjson;
  outVector.clear();
  const JValue::ConstMemberIterator properties = piece.FindMember(name);
  if (properties == piece.MemberEnd() || !properties->value.IsArray()) {
    return false;
  }
  outVector.reserve(properties->value.GetArray().Size());
  for (JValue::ConstValueIterator itr = properties->value.Begin(); itr != properties->value.End();
       ++itr) {
    T value;
    if (!getFromJValue(*itr, value)) {
      return false;
    }
    outVector.push_back(value);
  }
  return true;
}

template <typename JSTR>
inline bool getJString(string& outString, const JValue& piece, const JSTR& name) {
  const JValue::ConstMemberIterator member = piece.FindMember(name);
  if (member != piece.MemberEnd() && member->value.IsString()) {
    outString = member->value.GetString();
    return true;
  }
  outString.clear();
  return false;
}

template <typename JSTR>
inline bool getJInt64(int64_t& outInt64, const JValue& piece, const JSTR& name) {
  const JValue::ConstMemberIterator member = piece.FindMember(name);
  if (member != piece.MemberEnd() && member->value.IsInt64()) {
    outInt64 = member->value.GetInt64();
    return true;
  }
  outInt64 = 0;
  return false;
}

template <typename JSTR>
inline bool getJUInt32(uint32_t& outUInt, const JValue& piece, const JSTR& name) {
  const JValue::ConstMemberIterator member = piece.FindMember(name);
  if (member != piece.MemberEnd() && member->value.IsUint()) {
    outUInt = member->value.GetUint();
    return true;
  }
  outUInt = 0;
  return false;
}

/// Integers are accepted as doubles.
template <typename JSTR>
inline bool getJDouble(double& outDouble, const JValue& piece, const JSTR& name) {
  const JValue::ConstMemberIterator member = piece.FindMember(name);
  if (member != piece.MemberEnd() && member->value.IsNumber()) {
    outDouble = member->value.GetDouble();
    return true;
  }
  outDouble = 0;
  return false;
}

inline string jDocumentToJsonString(const JDocument& document) {
  using namespace reshard_rapidjson;
  StringBuffer buffer;
  using JWriter = reshard_rapidjson::
      Writer<StringBuffer, JUtf8Encoding, JUtf8Encoding, JCrtAllocator, kWriteNanAndInfFlag>;
  JWriter writer(buffer);
  document.Accept(writer);
  return buffer.GetString();
}

inline string jDocumentToJsonStringPretty(const JDocument& document) {
  using namespace reshard_rapidjson;
  StringBuffer buffer;
  using JPrettyWriter = reshard_rapidjson::PrettyWriter<
      StringBuffer,
      JUtf8Encoding,
      JUtf8Encoding,
      JCrtAllocator,
      kWriteNanAndInfFlag>;
  JPrettyWriter prettyWriter(buffer);
  prettyWriter.SetIndent(' ', 2);
  document.Accept(prettyWriter);
  return buffer.GetString();
}

} // namespace reshard
