#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <userver/formats/json/value.hpp>
#include <userver/utils/expected.hpp>

namespace transaction_monitor {

using JsonValue = userver::formats::json::Value;

// Typed, absence-tolerant access to a JSON object. Every accessor returns
// nullopt for a missing key, a null value or a value of another type.
namespace json_access {

std::optional<std::string> GetString(const JsonValue& object, std::string_view key);
std::optional<double> GetNumber(const JsonValue& object, std::string_view key);
std::optional<bool> GetBool(const JsonValue& object, std::string_view key);
std::optional<JsonValue> GetObject(const JsonValue& object, std::string_view key);

}  // namespace json_access

// Parses the metadata column of a transaction. An empty string is an empty
// object; anything that is not a JSON object is an error.
userver::utils::expected<JsonValue, std::string> ParseMetadata(const std::string& metadata);

// Signals produced by one signal group. Keys are written as "<prefix>.<name>".
class ContextFragment {
public:
    explicit ContextFragment(std::string prefix);

    void SetBool(std::string_view name, bool value);
    void SetNumber(std::string_view name, double value);
    void SetNumber(std::string_view name, std::optional<double> value);
    void SetString(std::string_view name, std::string value);
    void SetString(std::string_view name, std::optional<std::string> value);
    void SetString(std::string_view name, const char* value);
    void SetNull(std::string_view name);
    void SetValue(std::string_view name, JsonValue value);

    const std::string& GetPrefix() const { return prefix_; }
    const std::map<std::string, JsonValue>& GetSignals() const { return signals_; }

private:
    std::string MakeKey(std::string_view name) const;

    std::string prefix_;
    std::map<std::string, JsonValue> signals_;
};

// Flat per-evaluation mapping signal name -> value. Built once by the
// assembler and read-only for the rules afterwards.
class Context {
public:
    Context() = default;

    // Throws std::logic_error when a key is already present.
    void Merge(const ContextFragment& fragment);

    bool Contains(std::string_view key) const;
    size_t Size() const { return signals_.size(); }

    // Absent or null signals are nullopt; a value of another type throws
    // MalformedContextError.
    std::optional<bool> GetBool(std::string_view key) const;
    std::optional<double> GetNumber(std::string_view key) const;
    std::optional<std::string> GetString(std::string_view key) const;
    std::optional<JsonValue> GetList(std::string_view key) const;

    // Raw access for expression rules.
    std::optional<JsonValue> Find(std::string_view key) const;

    JsonValue ToJson() const;
    static Context FromJson(const JsonValue& json);

private:
    std::map<std::string, JsonValue, std::less<>> signals_;
};

}  // namespace transaction_monitor
