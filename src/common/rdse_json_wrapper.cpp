/***************************************************************************
 *   Copyright © 2021 by Andrey Afletdinov <public.irkutsk@gmail.com>      *
 *                                                                         *
 *   Part of the RDSE: Remote Desktop Session Engine                       *
 *                                                                         *
 *   This program is free software; you can redistribute it and/or modify  *
 *   it under the terms of the GNU General Public License as published by  *
 *   the Free Software Foundation; either version 3 of the License, or     *
 *   (at your option) any later version.                                   *
 *                                                                         *
 *   This program is distributed in the hope that it will be useful,       *
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
 *   GNU General Public License for more details.                          *
 *                                                                         *
 *   You should have received a copy of the GNU General Public License     *
 *   along with this program; if not, write to the                         *
 *   Free Software Foundation, Inc.,                                       *
 *   59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.             *
 ***************************************************************************/


// jsmn implementation unit
#include "jsmn/jsmn.h"

#include <cstdlib>
#include <charconv>

#include "rdse_tools.h"
#include "rdse_application.h"
#include "rdse_json_wrapper.h"

namespace RDSE
{
    /* JsonScalar */
    JsonType JsonScalar::getType(void) const
    {
        switch(value.index())
        {
            case 1: return JsonType::Boolean;
            case 2: return JsonType::Integer;
            case 3: return JsonType::Double;
            case 4: return JsonType::String;
            default: break;
        }

        return JsonType::Null;
    }

    int JsonScalar::getInteger(void) const
    {
        if(auto val = std::get_if<int>(& value))
        {
            return *val;
        }

        if(auto val = std::get_if<double>(& value))
        {
            return static_cast<int>(*val);
        }

        if(auto val = std::get_if<bool>(& value))
        {
            return *val ? 1 : 0;
        }

        if(auto val = std::get_if<std::string>(& value))
        {
            return std::strtol(val->c_str(), nullptr, 0);
        }

        return 0;
    }

    std::string JsonScalar::getString(void) const
    {
        switch(getType())
        {
            case JsonType::String: return std::get<std::string>(value);
            case JsonType::Integer: return std::to_string(std::get<int>(value));
            case JsonType::Double: return std::to_string(std::get<double>(value));
            case JsonType::Boolean: return std::get<bool>(value) ? "true" : "false";
            default: break;
        }

        return "null";
    }

    double JsonScalar::getDouble(void) const
    {
        if(auto val = std::get_if<double>(& value))
        {
            return *val;
        }

        if(auto val = std::get_if<std::string>(& value))
        {
            return std::strtod(val->c_str(), nullptr);
        }

        return getInteger();
    }

    bool JsonScalar::getBoolean(void) const
    {
        if(auto val = std::get_if<std::string>(& value))
        {
            auto str = Tools::lower(*val);
            return str == "true" || str == "yes" || str == "on" || str == "1";
        }

        if(auto val = std::get_if<double>(& value))
        {
            return *val != 0;
        }

        return getInteger();
    }

    /* JsonValuePtr */
    JsonValuePtr & JsonValuePtr::operator=(const JsonValuePtr & ptr)
    {
        if(this != & ptr)
        {
            reset(ptr ? ptr->clone() : nullptr);
        }

        return *this;
    }

    /* JsonArray */
    const JsonValue* JsonArray::getValue(size_t index) const
    {
        return index < content.size() ? content[index].get() : nullptr;
    }

    /* JsonObject */
    void JsonObject::setValue(const std::string & key, JsonValuePtr && ptr)
    {
        auto it = content.find(key);

        if(it != content.end())
        {
            it->second = std::move(ptr);
        }
        else
        {
            content.emplace(key, std::move(ptr));
        }
    }

    bool JsonObject::hasKey(std::string_view key) const
    {
        return content.end() != content.find(std::string(key));
    }

    std::list<std::string> JsonObject::keys(void) const
    {
        std::list<std::string> res;

        for(const auto & [key, val] : content)
        {
            res.push_back(key);
        }

        return res;
    }

    const JsonValue* JsonObject::getValue(std::string_view key) const
    {
        auto it = content.find(std::string(key));
        return it != content.end() ? it->second.get() : nullptr;
    }

    const JsonObject* JsonObject::getObject(std::string_view key) const
    {
        auto jv = getValue(key);
        return jv && jv->isObject() ? static_cast<const JsonObject*>(jv) : nullptr;
    }

    const JsonArray* JsonObject::getArray(std::string_view key) const
    {
        auto jv = getValue(key);
        return jv && jv->isArray() ? static_cast<const JsonArray*>(jv) : nullptr;
    }

    int JsonObject::getInteger(std::string_view key, int def) const
    {
        auto jv = getValue(key);
        return jv ? jv->getInteger() : def;
    }

    std::string JsonObject::getString(std::string_view key, std::string_view def) const
    {
        auto jv = getValue(key);
        return jv ? jv->getString() : std::string(def);
    }

    double JsonObject::getDouble(std::string_view key, double def) const
    {
        auto jv = getValue(key);
        return jv ? jv->getDouble() : def;
    }

    bool JsonObject::getBoolean(std::string_view key, bool def) const
    {
        auto jv = getValue(key);
        return jv ? jv->getBoolean() : def;
    }

    void JsonObject::addString(const std::string & key, std::string_view val)
    {
        setValue(key, JsonValuePtr(new JsonScalar(std::string(val))));
    }

    void JsonObject::swap(JsonObject & jo) noexcept
    {
        content.swap(jo.content);
    }

    /* JsonContent */
    bool JsonContent::parse(std::string_view str)
    {
        tokens.clear();
        text.clear();

        jsmn_parser parser;
        jsmn_init(& parser);

        // first pass counts tokens
        int counts = jsmn_parse(& parser, str.data(), str.size(), nullptr, 0);

        if(0 < counts)
        {
            tokens.resize(counts);
            jsmn_init(& parser);
            counts = jsmn_parse(& parser, str.data(), str.size(), tokens.data(), tokens.size());
        }

        if(counts <= 0)
        {
            const char* reason = counts == JSMN_ERROR_INVAL ? "invalid character" :
                                 (counts == JSMN_ERROR_PART ? "incomplete content" : "empty content");
            Application::error("%s: %s, size: %lu", __FUNCTION__, reason, str.size());
            tokens.clear();
            return false;
        }

        tokens.resize(counts);
        text.assign(str.begin(), str.end());

        return true;
    }

    bool JsonContent::readFile(const std::filesystem::path & file)
    {
        auto str = Tools::fileToString(file);

        if(str.empty())
        {
            Application::error("%s: %s, path: `%s'", __FUNCTION__, "empty file", file.c_str());
            return false;
        }

        return parse(str);
    }

    std::string_view JsonContent::tokenString(const jsmntok_t & tok) const
    {
        if(0 <= tok.start && tok.start < tok.end && static_cast<size_t>(tok.end) <= text.size())
        {
            return std::string_view(text.data() + tok.start, tok.end - tok.start);
        }

        return {};
    }

    JsonValuePtr JsonContent::buildScalar(const jsmntok_t & tok) const
    {
        auto str = tokenString(tok);

        if(tok.type == JSMN_STRING)
        {
            return JsonValuePtr(new JsonScalar(Tools::unescaped(str)));
        }

        if(str == "true" || str == "false")
        {
            return JsonValuePtr(new JsonScalar(str == "true"));
        }

        if(str.empty() || str == "null")
        {
            return JsonValuePtr(new JsonScalar());
        }

        if(std::string_view::npos == str.find_first_of(".eE"))
        {
            int val = 0;
            auto [ptr, err] = std::from_chars(str.data(), str.data() + str.size(), val);

            if(err == std::errc() && ptr == str.data() + str.size())
            {
                return JsonValuePtr(new JsonScalar(val));
            }
        }
        else
        {
            const std::string num(str);
            char* end = nullptr;
            double val = std::strtod(num.c_str(), & end);

            if(end && *end == 0)
            {
                return JsonValuePtr(new JsonScalar(val));
            }
        }

        Application::warning("%s: invalid primitive: `%.*s'", __FUNCTION__, (int) str.size(), str.data());
        return JsonValuePtr(new JsonScalar());
    }

    JsonValuePtr JsonContent::buildValue(size_t & pos) const
    {
        if(pos >= tokens.size())
        {
            return JsonValuePtr(new JsonScalar());
        }

        const jsmntok_t & tok = tokens[pos++];

        if(tok.type == JSMN_ARRAY)
        {
            auto arr = new JsonArray();
            arr->content.reserve(tok.size);

            for(int it = 0; it < tok.size && pos < tokens.size(); ++it)
            {
                arr->content.emplace_back(buildValue(pos));
            }

            return JsonValuePtr(arr);
        }

        if(tok.type == JSMN_OBJECT)
        {
            auto obj = new JsonObject();

            // pairs: key token, then value subtree
            for(int it = 0; it < tok.size && pos < tokens.size(); ++it)
            {
                auto key = Tools::unescaped(tokenString(tokens[pos++]));
                obj->setValue(key, buildValue(pos));
            }

            return JsonValuePtr(obj);
        }

        return buildScalar(tok);
    }

    JsonObject JsonContent::toObject(void) const
    {
        JsonObject res;

        if(isObject())
        {
            size_t pos = 0;
            auto ptr = buildValue(pos);
            res.swap(static_cast<JsonObject &>(*ptr));
        }

        return res;
    }
}
