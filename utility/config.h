// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#pragma once
#include <string>
#include <stdint.h>
#include <limits>
#include <unordered_map>
#include <any>

namespace srcverify {

/// Verifier settings source. Integers are stored as Int, arrays and nulls are ignored
class Config {
public:
    using Int = int64_t;

    Config() = default;
    Config(const Config& r) = default;
    Config& operator=(const Config& r) = default;
    Config(Config&&) = default;
    Config& operator=(Config&&) = default;

    bool empty() const {
        return _values.empty();
    }

    /// Loads from json file and throws on error. Nested objects are flattened into dotted keys
    void load(const std::string& fileName);

    /// Same as load(), from in-memory text
    void load_from_string(const std::string& text);

    template<typename T> void set(const std::string& key, T value) {
        _values[key] = std::any(std::move(value));
    }

    bool has_key(const std::string& key) const {
        return _values.count(key) == 1;
    }

    template <typename T> const T& get(const std::string& key, const T& defValue=T()) const {
        auto it = _values.find(key);
        if (it == _values.end()) return defValue;
        const T* value = std::any_cast<T>(&it->second);
        return value ? *value : defValue;
    }

    bool get_bool(const std::string& key, bool defValue=false) const {
        return get<bool>(key, defValue);
    }

    int get_int(
        const std::string& key,
        int defValue=0,
        int minValue=std::numeric_limits<int>::min(),
        int maxValue=std::numeric_limits<int>::max()
    ) const {
        Int val = get<Int>(key, defValue);
        if (val <= minValue) return minValue;
        if (val >= maxValue) return maxValue;
        return int(val);
    }

private:
    void parse(const std::string& filtered, const std::string& origin);

    std::unordered_map<std::string, std::any> _values;
};

} //namespace
