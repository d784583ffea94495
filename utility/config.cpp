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


#include "config.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace srcverify {

namespace {

using json = nlohmann::json;

void filter_comments(char* line) {
    char* p = line;
    char prev = *p;
    if (!prev) return;
    if (prev == '#') {
        *p = 0;
        return;
    }
    int nQuotes = 0;
    for (++p; *p; ++p) {
        char c = *p;
        if (c == '#' && (nQuotes % 2) == 0) {
            *p = 0;
            return;
        }
        if (c == '"' && prev != '\\') ++nQuotes;
        prev = c;
    }
}

std::string filter_stream(std::istream& in) {
    constexpr size_t LINESIZE = 2048;
    char buf[LINESIZE];

    std::string filtered;

    while (in.getline(buf, LINESIZE)) {
        filter_comments(buf);
        filtered.append(buf);
    }

    return filtered;
}

using Values = std::unordered_map<std::string, std::any>;

void add_object(Values& v, const json& o, const std::string& name) {
    switch (o.type()) {
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            v[name] = std::any(o.get<int64_t>());
            break;
        case json::value_t::boolean:
            v[name] = std::any(o.get<bool>());
            break;
        case json::value_t::string:
            v[name] = std::any(o.get<std::string>());
            break;
        case json::value_t::object:
            for (json::const_iterator it = o.begin(); it != o.end(); ++it) {
                add_object(v, it.value(), name + "." + it.key());
            }
            break;
        default:
            break;
    }
}

} //namespace

void Config::load(const std::string& fileName) {
    std::ifstream file(fileName);
    if (!file) throw std::runtime_error(std::string("cannot open config file ") + fileName);
    parse(filter_stream(file), fileName);
}

void Config::load_from_string(const std::string& text) {
    std::istringstream in(text);
    parse(filter_stream(in), "<string>");
}

void Config::parse(const std::string& filtered, const std::string& origin) {
    if (filtered.empty()) throw std::runtime_error(std::string("empty config ") + origin);

    json j;
    try {
        j = json::parse(filtered);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("bad config ") + origin + ": " + e.what());
    }
    if (!j.is_object()) throw std::runtime_error(std::string("bad config format ") + origin);

    for (json::iterator it = j.begin(); it != j.end(); ++it) {
        add_object(_values, it.value(), it.key());
    }
}

} //namespace
