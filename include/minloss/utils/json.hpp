/*
 * json.hpp
 *
 *  Created on: Mar 5, 2024
 *      Author: Maciej Kozarzewski
 */

#ifndef MINLOSS_UTILS_JSON_HPP_
#define MINLOSS_UTILS_JSON_HPP_

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

enum class JsonType
{
	Null, Bool, Number, String, Array, Object
};

/*
 * Minimal JSON value. Objects keep the insertion order of their keys.
 */
class Json
{
	private:
		struct NullObject
		{
		};

		typedef NullObject json_null;
		typedef bool json_bool;
		typedef double json_number;
		typedef std::string json_string;
		typedef std::vector<Json> json_array;

		typedef std::pair<json_string, Json> key_value_pair;
		typedef std::vector<key_value_pair> json_object;

		std::variant<json_null, json_bool, json_number, json_string, json_array, json_object> m_data;
	public:
		Json(JsonType type) noexcept;
		Json() noexcept;
		Json(bool b) noexcept;
		Json(int i) noexcept;
		Json(float f) noexcept;
		Json(double d) noexcept;
		Json(const std::string &str);
		Json(const char *str);
		/*
		 * A list made only of [string, value] pairs becomes an object, anything else becomes an array.
		 */
		Json(std::initializer_list<Json> list);

		bool isNull() const noexcept;
		bool isBool() const noexcept;
		bool isNumber() const noexcept;
		bool isString() const noexcept;
		bool isArray() const noexcept;
		bool isObject() const noexcept;

		operator bool() const;
		operator int() const;
		operator float() const;
		operator double() const;
		operator std::string() const;

		bool getBool() const;
		int getInt() const;
		double getDouble() const;
		std::string getString() const;

		const Json& operator[](int idx) const;
		Json& operator[](int idx);
		const Json& operator[](const std::string &key) const;
		Json& operator[](const std::string &key);
		const Json& operator[](const char *key) const;
		Json& operator[](const char *key);

		const Json* find(const std::string &key) const noexcept;
		Json* find(const std::string &key) noexcept;
		const std::pair<std::string, Json>& entry(int idx) const;

		int size() const noexcept;
		bool isEmpty() const noexcept;
		const char* storedType() const noexcept;

		std::string dump(int indent = -1) const;
		static Json load(const std::string &str);
	private:
		JsonType get_type() const noexcept;
		const json_array& as_array() const;
		json_array& as_array();
		const json_object& as_object() const;
		json_object& as_object();
};

class JsonKeyError: public std::logic_error
{
	public:
		JsonKeyError(const char *method, const std::string &key);
};
class JsonTypeError: public std::logic_error
{
	public:
		JsonTypeError(const char *method, const char *current_type);
};
class JsonParsingError: public std::logic_error
{
	public:
		JsonParsingError(const char *method, const std::string &message, size_t offset);
};

#endif /* MINLOSS_UTILS_JSON_HPP_ */
