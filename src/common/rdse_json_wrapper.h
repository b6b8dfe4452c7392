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


#ifndef _RDSE_JSON_WRAPPER_
#define _RDSE_JSON_WRAPPER_

#include <list>
#include <string>
#include <vector>
#include <memory>
#include <variant>
#include <filesystem>
#include <string_view>

#define JSMN_HEADER
#include "jsmn/jsmn.h"
#include "rdse_global.h"

namespace RDSE
{
    enum class JsonType { Null, Integer, Double, String, Boolean, Object, Array };

    /// @brief: json value interface, scalar getters convert between types
    class JsonValue
    {
    public:
        JsonValue() = default;
        virtual ~JsonValue() = default;

        virtual JsonType getType(void) const = 0;
        virtual JsonValue* clone(void) const = 0;

        virtual int getInteger(void) const { return 0; }
        virtual std::string getString(void) const { return ""; }
        virtual double getDouble(void) const { return 0; }
        virtual bool getBoolean(void) const { return false; }

        bool isObject(void) const { return getType() == JsonType::Object; }
        bool isArray(void) const { return getType() == JsonType::Array; }

        template<typename T>
        T get(void) const;
    };

    template<> inline int JsonValue::get<int>(void) const { return getInteger(); }
    template<> inline std::string JsonValue::get<std::string>(void) const { return getString(); }
    template<> inline double JsonValue::get<double>(void) const { return getDouble(); }
    template<> inline bool JsonValue::get<bool>(void) const { return getBoolean(); }

    /// @brief: null, boolean, integer, double or string
    class JsonScalar : public JsonValue
    {
        std::variant<std::nullptr_t, bool, int, double, std::string> value;

    public:
        JsonScalar() : value(nullptr) {}

        explicit JsonScalar(bool val) : value(val) {}
        explicit JsonScalar(int val) : value(val) {}
        explicit JsonScalar(double val) : value(val) {}
        explicit JsonScalar(std::string val) : value(std::move(val)) {}

        JsonType getType(void) const override;
        JsonValue* clone(void) const override { return new JsonScalar(*this); }

        int getInteger(void) const override;
        std::string getString(void) const override;
        double getDouble(void) const override;
        bool getBoolean(void) const override;
    };

    /// @brief: owning value pointer, copies are deep
    class JsonValuePtr : public std::unique_ptr<JsonValue>
    {
    public:
        JsonValuePtr() = default;
        explicit JsonValuePtr(JsonValue* ptr) : std::unique_ptr<JsonValue>(ptr) {}

        JsonValuePtr(const JsonValuePtr & ptr) : std::unique_ptr<JsonValue>(ptr ? ptr->clone() : nullptr) {}
        JsonValuePtr(JsonValuePtr &&) noexcept = default;

        JsonValuePtr & operator=(const JsonValuePtr &);
        JsonValuePtr & operator=(JsonValuePtr &&) noexcept = default;
    };

    class JsonArray : public JsonValue
    {
    protected:
        std::vector<JsonValuePtr> content;
        friend class JsonContent;

    public:
        JsonArray() = default;

        JsonType getType(void) const override { return JsonType::Array; }
        JsonValue* clone(void) const override { return new JsonArray(*this); }

        size_t size(void) const { return content.size(); }
        const JsonValue* getValue(size_t index) const;

        template<typename T>
        std::list<T> toStdList(void) const
        {
            std::list<T> res;

            for(const auto & ptr : content)
            {
                res.emplace_back(ptr->template get<T>());
            }

            return res;
        }
    };

    class JsonObject : public JsonValue
    {
    protected:
        INTMAP<std::string, JsonValuePtr> content;
        friend class JsonContent;

        void setValue(const std::string & key, JsonValuePtr && ptr);

    public:
        JsonObject() = default;

        JsonType getType(void) const override { return JsonType::Object; }
        JsonValue* clone(void) const override { return new JsonObject(*this); }

        size_t size(void) const { return content.size(); }
        bool hasKey(std::string_view) const;
        std::list<std::string> keys(void) const;

        const JsonValue* getValue(std::string_view) const;
        const JsonObject* getObject(std::string_view) const;
        const JsonArray* getArray(std::string_view) const;

        int getInteger(std::string_view, int def = 0) const;
        std::string getString(std::string_view, std::string_view def = "") const;
        double getDouble(std::string_view, double def = 0) const;
        bool getBoolean(std::string_view, bool def = false) const;

        void addString(const std::string &, std::string_view);
        void swap(JsonObject &) noexcept;

        template<typename T>
        std::list<T> getStdList(std::string_view key) const
        {
            auto jarr = getArray(key);
            return jarr ? jarr->template toStdList<T>() : std::list<T>();
        }
    };

    /// @brief: jsmn tokenized document
    class JsonContent
    {
        std::string text;
        std::vector<jsmntok_t> tokens;

    protected:
        std::string_view tokenString(const jsmntok_t &) const;
        JsonValuePtr buildValue(size_t & pos) const;
        JsonValuePtr buildScalar(const jsmntok_t &) const;

    public:
        JsonContent() = default;

        bool parse(std::string_view);
        bool readFile(const std::filesystem::path &);

        bool isValid(void) const { return ! tokens.empty(); }
        bool isObject(void) const { return isValid() && tokens.front().type == JSMN_OBJECT; }

        JsonObject toObject(void) const;
    };

    class JsonContentString : public JsonContent
    {
    public:
        explicit JsonContentString(std::string_view str) { parse(str); }
    };

    class JsonContentFile : public JsonContent
    {
    public:
        explicit JsonContentFile(const std::filesystem::path & file) { readFile(file); }
    };
}

#endif // _RDSE_JSON_WRAPPER_
