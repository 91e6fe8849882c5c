#include "context.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include <userver/formats/json/exception.hpp>
#include <userver/formats/json/inline.hpp>
#include <userver/formats/json/serialize.hpp>
#include <userver/formats/json/value_builder.hpp>

#include "errors/errors.hpp"

namespace transaction_monitor {

namespace {

bool IsNumber(const JsonValue& value) {
    return value.IsDouble() || value.IsInt64() || value.IsUInt64();
}

std::optional<JsonValue> Member(const JsonValue& object, std::string_view key) {
    if (!object.IsObject() || !object.HasMember(key)) {
        return std::nullopt;
    }
    JsonValue value = object[std::string{key}];
    if (value.IsNull()) {
        return std::nullopt;
    }
    return value;
}

template <typename T>
JsonValue MakeValue(T&& value) {
    return userver::formats::json::ValueBuilder(std::forward<T>(value)).ExtractValue();
}

}  // namespace

namespace json_access {

std::optional<std::string> GetString(const JsonValue& object, std::string_view key) {
    auto value = Member(object, key);
    if (!value || !value->IsString()) return std::nullopt;
    return value->As<std::string>();
}

std::optional<double> GetNumber(const JsonValue& object, std::string_view key) {
    auto value = Member(object, key);
    if (!value || !IsNumber(*value)) return std::nullopt;
    return value->As<double>();
}

std::optional<bool> GetBool(const JsonValue& object, std::string_view key) {
    auto value = Member(object, key);
    if (!value || !value->IsBool()) return std::nullopt;
    return value->As<bool>();
}

std::optional<JsonValue> GetObject(const JsonValue& object, std::string_view key) {
    auto value = Member(object, key);
    if (!value || !value->IsObject()) return std::nullopt;
    return value;
}

}  // namespace json_access

userver::utils::expected<JsonValue, std::string> ParseMetadata(const std::string& metadata) {
    if (metadata.empty()) {
        return userver::formats::json::MakeObject();
    }
    try {
        auto value = userver::formats::json::FromString(metadata);
        if (!value.IsObject()) {
            return userver::utils::unexpected<std::string>("metadata is not a JSON object");
        }
        return value;
    } catch (const userver::formats::json::Exception& e) {
        return userver::utils::unexpected<std::string>(e.what());
    }
}

ContextFragment::ContextFragment(std::string prefix)
    : prefix_(std::move(prefix)) {}

std::string ContextFragment::MakeKey(std::string_view name) const {
    return fmt::format("{}.{}", prefix_, name);
}

void ContextFragment::SetBool(std::string_view name, bool value) {
    signals_[MakeKey(name)] = MakeValue(value);
}

void ContextFragment::SetNumber(std::string_view name, double value) {
    signals_[MakeKey(name)] = MakeValue(value);
}

void ContextFragment::SetNumber(std::string_view name, std::optional<double> value) {
    if (value) {
        SetNumber(name, *value);
    } else {
        SetNull(name);
    }
}

void ContextFragment::SetString(std::string_view name, std::string value) {
    signals_[MakeKey(name)] = MakeValue(std::move(value));
}

void ContextFragment::SetString(std::string_view name, std::optional<std::string> value) {
    if (value) {
        SetString(name, std::move(*value));
    } else {
        SetNull(name);
    }
}

void ContextFragment::SetString(std::string_view name, const char* value) {
    SetString(name, std::string{value});
}

void ContextFragment::SetNull(std::string_view name) {
    signals_[MakeKey(name)] =
        userver::formats::json::ValueBuilder(userver::formats::common::Type::kNull).ExtractValue();
}

void ContextFragment::SetValue(std::string_view name, JsonValue value) {
    signals_[MakeKey(name)] = std::move(value);
}

void Context::Merge(const ContextFragment& fragment) {
    for (const auto& [key, value] : fragment.GetSignals()) {
        auto [it, inserted] = signals_.emplace(key, value);
        if (!inserted) {
            throw std::logic_error(fmt::format("Duplicate context signal '{}'", key));
        }
    }
}

bool Context::Contains(std::string_view key) const {
    return signals_.find(key) != signals_.end();
}

std::optional<JsonValue> Context::Find(std::string_view key) const {
    auto it = signals_.find(key);
    if (it == signals_.end() || it->second.IsNull()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<bool> Context::GetBool(std::string_view key) const {
    auto value = Find(key);
    if (!value) return std::nullopt;
    if (!value->IsBool()) {
        throw MalformedContextError(fmt::format("Signal '{}' is not a boolean", key));
    }
    return value->As<bool>();
}

std::optional<double> Context::GetNumber(std::string_view key) const {
    auto value = Find(key);
    if (!value) return std::nullopt;
    if (!IsNumber(*value)) {
        throw MalformedContextError(fmt::format("Signal '{}' is not a number", key));
    }
    return value->As<double>();
}

std::optional<std::string> Context::GetString(std::string_view key) const {
    auto value = Find(key);
    if (!value) return std::nullopt;
    if (!value->IsString()) {
        throw MalformedContextError(fmt::format("Signal '{}' is not a string", key));
    }
    return value->As<std::string>();
}

std::optional<JsonValue> Context::GetList(std::string_view key) const {
    auto value = Find(key);
    if (!value) return std::nullopt;
    if (!value->IsArray()) {
        throw MalformedContextError(fmt::format("Signal '{}' is not a list", key));
    }
    return value;
}

JsonValue Context::ToJson() const {
    userver::formats::json::ValueBuilder builder(userver::formats::common::Type::kObject);
    for (const auto& [key, value] : signals_) {
        builder[key] = value;
    }
    return builder.ExtractValue();
}

Context Context::FromJson(const JsonValue& json) {
    Context context;
    for (auto it = json.begin(); it != json.end(); ++it) {
        context.signals_.emplace(it.GetName(), *it);
    }
    return context;
}

}  // namespace transaction_monitor
