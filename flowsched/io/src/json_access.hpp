#pragma once

// Private helpers shared by the JSON readers of this library.

#include <flowsched/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace flowsched::io::detail {

inline const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                          const std::string& context) {
    if (!obj.IsObject() || !obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

inline double get_double(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

inline uint64_t get_uint64(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer", context);
    }
    return member.GetUint64();
}

inline int64_t get_int64(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsInt64()) {
        throw LoaderError(std::string("field '") + name + "' must be an integer", context);
    }
    return member.GetInt64();
}

inline std::string get_string(const rapidjson::Value& obj, const char* name, const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

inline const rapidjson::Value& get_array(const rapidjson::Value& obj, const char* name,
                                         const std::string& context) {
    const auto& member = get_member(obj, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

inline uint64_t get_uint64_or(const rapidjson::Value& obj, const char* name, uint64_t fallback,
                              const std::string& context) {
    if (!obj.HasMember(name)) {
        return fallback;
    }
    return get_uint64(obj, name, context);
}

inline bool get_bool_or(const rapidjson::Value& obj, const char* name, bool fallback,
                        const std::string& context) {
    if (!obj.HasMember(name)) {
        return fallback;
    }
    const auto& member = obj[name];
    if (!member.IsBool()) {
        throw LoaderError(std::string("field '") + name + "' must be a boolean", context);
    }
    return member.GetBool();
}

/// Parse @p json into @p doc, requiring an object at the root.
inline void parse_object(rapidjson::Document& doc, std::string_view json, const std::string& context) {
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        throw LoaderError(std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
                          context + " at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", context);
    }
}

} // namespace flowsched::io::detail
