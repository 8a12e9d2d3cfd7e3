/*
 * json.cpp
 *
 *  Created on: Mar 5, 2024
 *      Author: Maciej Kozarzewski
 */

#include <minloss/utils/json.hpp>
#include <minloss/core/ml_exceptions.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace
{
	class JsonSerializer
	{
			std::string m_result;
			const int m_indent_step;
			const bool m_pretty_print;
		public:
			explicit JsonSerializer(int indent) :
					m_indent_step(indent),
					m_pretty_print(indent != -1)
			{
				m_result.reserve(1024);
			}
			void dump(const Json &json, int current_indent = 0)
			{
				if (json.isNull())
					m_result += "null";
				if (json.isBool())
					m_result += json.getBool() ? "true" : "false";
				if (json.isNumber())
					write_number(json.getDouble());
				if (json.isString())
					write_string(json.getString());
				if (json.isArray())
					write_array(json, current_indent);
				if (json.isObject())
					write_object(json, current_indent);
			}
			const std::string& getString() const noexcept
			{
				return m_result;
			}
		private:
			bool is_primitive(const Json &json) const
			{
				return not (json.isArray() or json.isObject()) or json.isEmpty();
			}
			void new_line(int indent)
			{
				if (m_pretty_print)
				{
					m_result += '\n';
					m_result.append(indent, ' ');
				}
			}
			void write_array(const Json &json, int current_indent)
			{
				if (json.isEmpty())
				{
					m_result += "[]";
					return;
				}
				bool all_primitives = true;
				for (int i = 0; i < json.size(); i++)
					all_primitives &= is_primitive(json[i]);

				const int new_indent = current_indent + m_indent_step;
				m_result += '[';
				for (int i = 0; i < json.size(); i++)
				{
					if (i != 0)
					{
						m_result += ',';
						if (m_pretty_print and all_primitives)
							m_result += ' ';
					}
					if (not all_primitives)
						new_line(new_indent);
					dump(json[i], new_indent);
				}
				if (not all_primitives)
					new_line(current_indent);
				m_result += ']';
			}
			void write_object(const Json &json, int current_indent)
			{
				if (json.isEmpty())
				{
					m_result += "{}";
					return;
				}
				const int new_indent = current_indent + m_indent_step;
				m_result += '{';
				for (int i = 0; i < json.size(); i++)
				{
					if (i != 0)
						m_result += ',';
					new_line(new_indent);
					write_string(json.entry(i).first);
					m_result += m_pretty_print ? ": " : ":";
					dump(json.entry(i).second, new_indent);
				}
				new_line(current_indent);
				m_result += '}';
			}
			void write_number(double d)
			{
				if (std::isnan(d) or std::isinf(d))
				{
					m_result += "null"; // JSON has no representation of non-finite numbers
					return;
				}
				char buffer[32];
				std::snprintf(buffer, sizeof(buffer), "%.9g", d);
				m_result += buffer;
			}
			void write_string(const std::string &str)
			{
				m_result += '\"';
				for (char c : str)
					switch (c)
					{
						case '\"':
							m_result += "\\\"";
							break;
						case '\\':
							m_result += "\\\\";
							break;
						case '\n':
							m_result += "\\n";
							break;
						case '\t':
							m_result += "\\t";
							break;
						default:
							m_result += c;
							break;
					}
				m_result += '\"';
			}
	};

	class JsonDeserializer
	{
			const std::string &m_data;
			size_t m_offset = 0;
		public:
			explicit JsonDeserializer(const std::string &str) :
					m_data(str)
			{
			}
			Json loadDocument()
			{
				Json result = load();
				skip_whitespace();
				if (m_offset != m_data.size())
					throw JsonParsingError(METHOD_NAME, "unexpected trailing characters", m_offset);
				return result;
			}
		private:
			Json load()
			{
				skip_whitespace();
				switch (peek())
				{
					case '{':
						return load_object();
					case '[':
						return load_array();
					case '\"':
						return Json(load_string());
					default:
						return load_primitive_type();
				}
			}
			char peek() const
			{
				if (m_offset >= m_data.size())
					throw JsonParsingError(METHOD_NAME, "unexpected end of input", m_offset);
				return m_data[m_offset];
			}
			void expect(char c)
			{
				skip_whitespace();
				if (peek() != c)
					throw JsonParsingError(METHOD_NAME, std::string("expected '") + c + "', got '" + peek() + "'", m_offset);
				m_offset++;
			}
			bool consume_if(char c)
			{
				skip_whitespace();
				if (m_offset < m_data.size() and m_data[m_offset] == c)
				{
					m_offset++;
					return true;
				}
				return false;
			}
			void skip_whitespace() noexcept
			{
				while (m_offset < m_data.size() and std::isspace(static_cast<unsigned char>(m_data[m_offset])))
					m_offset++;
			}
			Json load_object()
			{
				expect('{');
				Json result(JsonType::Object);
				if (consume_if('}'))
					return result;
				do
				{
					skip_whitespace();
					const std::string key = load_string();
					expect(':');
					result[key] = load();
				} while (consume_if(','));
				expect('}');
				return result;
			}
			Json load_array()
			{
				expect('[');
				Json result(JsonType::Array);
				if (consume_if(']'))
					return result;
				do
				{
					result[result.size()] = load();
				} while (consume_if(','));
				expect(']');
				return result;
			}
			std::string load_string()
			{
				expect('\"');
				std::string result;
				while (true)
				{
					const char c = peek();
					m_offset++;
					if (c == '\"')
						return result;
					if (c != '\\')
					{
						result += c;
						continue;
					}
					const char escaped = peek();
					m_offset++;
					switch (escaped)
					{
						case 'n':
							result += '\n';
							break;
						case 't':
							result += '\t';
							break;
						case 'r':
							result += '\r';
							break;
						case '\"':
						case '\\':
						case '/':
							result += escaped;
							break;
						default:
							throw JsonParsingError(METHOD_NAME, std::string("unsupported escape sequence '\\") + escaped + "'", m_offset);
					}
				}
			}
			Json load_primitive_type()
			{
				const char *str = m_data.c_str() + m_offset;
				const size_t remaining = m_data.size() - m_offset;
				if (remaining >= 4 and std::memcmp(str, "null", 4) == 0)
				{
					m_offset += 4;
					return Json();
				}
				if (remaining >= 4 and std::memcmp(str, "true", 4) == 0)
				{
					m_offset += 4;
					return Json(true);
				}
				if (remaining >= 5 and std::memcmp(str, "false", 5) == 0)
				{
					m_offset += 5;
					return Json(false);
				}

				const size_t length = number_length(str, remaining);
				if (length == 0)
					throw JsonParsingError(METHOD_NAME, "not a primitive type", m_offset);
				const double value = std::strtod(std::string(str, length).c_str(), nullptr);
				if (value == HUGE_VAL or value == -HUGE_VAL)
					throw JsonParsingError(METHOD_NAME, "number out of range", m_offset);
				m_offset += length;
				return Json(value);
			}
			/*
			 * Returns the length of a JSON number (-?int frac? exp?) at the beginning of 'str', or 0 if there is none.
			 */
			static size_t number_length(const char *str, size_t remaining) noexcept
			{
				size_t i = 0;
				auto is_digit = [&](size_t idx)
				{
					return idx < remaining and std::isdigit(static_cast<unsigned char>(str[idx]));
				};
				if (i < remaining and str[i] == '-')
					i++;
				if (not is_digit(i))
					return 0;
				if (str[i] == '0')
					i++;
				else
					while (is_digit(i))
						i++;
				if (i < remaining and str[i] == '.')
				{
					i++;
					if (not is_digit(i))
						return 0;
					while (is_digit(i))
						i++;
				}
				if (i < remaining and (str[i] == 'e' or str[i] == 'E'))
				{
					i++;
					if (i < remaining and (str[i] == '+' or str[i] == '-'))
						i++;
					if (not is_digit(i))
						return 0;
					while (is_digit(i))
						i++;
				}
				return i;
			}
	};
}

Json::Json(JsonType type) noexcept
{
	switch (type)
	{
		default:
		case JsonType::Null:
			break;
		case JsonType::Bool:
			m_data = false;
			break;
		case JsonType::Number:
			m_data = 0.0;
			break;
		case JsonType::String:
			m_data = json_string();
			break;
		case JsonType::Array:
			m_data = json_array();
			break;
		case JsonType::Object:
			m_data = json_object();
			break;
	}
}
Json::Json() noexcept :
		m_data(NullObject())
{
}
Json::Json(bool b) noexcept :
		m_data(b)
{
}
Json::Json(int i) noexcept :
		m_data(static_cast<json_number>(i))
{
}
Json::Json(float f) noexcept :
		m_data(static_cast<json_number>(f))
{
}
Json::Json(double d) noexcept :
		m_data(d)
{
}
Json::Json(const std::string &str) :
		m_data(json_string(str))
{
}
Json::Json(const char *str) :
		m_data(json_string(str))
{
}
Json::Json(std::initializer_list<Json> list)
{
	const bool is_object = std::all_of(list.begin(), list.end(), [](const Json &element)
	{
		return element.isArray() and element.size() == 2 and element[0].isString();
	});

	if (is_object and list.size() > 0)
	{
		m_data = json_object();
		for (auto element = list.begin(); element < list.end(); element++)
			as_object().push_back(key_value_pair(element->as_array()[0].getString(), element->as_array()[1]));
	}
	else
		m_data = json_array(list);
}

bool Json::isNull() const noexcept
{
	return std::holds_alternative<json_null>(m_data);
}
bool Json::isBool() const noexcept
{
	return std::holds_alternative<json_bool>(m_data);
}
bool Json::isNumber() const noexcept
{
	return std::holds_alternative<json_number>(m_data);
}
bool Json::isString() const noexcept
{
	return std::holds_alternative<json_string>(m_data);
}
bool Json::isArray() const noexcept
{
	return std::holds_alternative<json_array>(m_data);
}
bool Json::isObject() const noexcept
{
	return std::holds_alternative<json_object>(m_data);
}

Json::operator bool() const
{
	return getBool();
}
Json::operator int() const
{
	return getInt();
}
Json::operator float() const
{
	return static_cast<float>(getDouble());
}
Json::operator double() const
{
	return getDouble();
}
Json::operator std::string() const
{
	return getString();
}

bool Json::getBool() const
{
	if (not isBool())
		throw JsonTypeError(METHOD_NAME, storedType());
	return std::get<json_bool>(m_data);
}
int Json::getInt() const
{
	if (not isNumber())
		throw JsonTypeError(METHOD_NAME, storedType());
	return static_cast<int>(std::get<json_number>(m_data));
}
double Json::getDouble() const
{
	if (not isNumber())
		throw JsonTypeError(METHOD_NAME, storedType());
	return std::get<json_number>(m_data);
}
std::string Json::getString() const
{
	if (not isString())
		throw JsonTypeError(METHOD_NAME, storedType());
	return std::get<json_string>(m_data);
}

const Json& Json::operator[](int idx) const
{
	const json_array &array = as_array();
	if (idx < 0 or idx >= static_cast<int>(array.size()))
		throw mls::IndexOutOfBounds(METHOD_NAME, "idx", idx, static_cast<int>(array.size()));
	return array[idx];
}
Json& Json::operator[](int idx)
{
	if (isNull()) // null json can be turned into an array
		m_data = json_array();
	json_array &array = as_array();
	if (idx < 0)
		throw mls::IndexOutOfBounds(METHOD_NAME, "idx", idx, static_cast<int>(array.size()));
	if (static_cast<size_t>(idx) >= array.size()) // missing elements are created as null
		array.resize(idx + 1);
	return array[idx];
}
const Json& Json::operator[](const std::string &key) const
{
	if (not isObject())
		throw JsonTypeError(METHOD_NAME, storedType());
	const Json *element = find(key);
	if (element == nullptr)
		throw JsonKeyError(METHOD_NAME, key);
	return *element;
}
Json& Json::operator[](const std::string &key)
{
	if (isNull()) // null json can be turned into an object
		m_data = json_object();
	Json *element = find(key);
	if (element != nullptr)
		return *element;
	as_object().push_back(key_value_pair(key, Json()));
	return as_object().back().second;
}
const Json& Json::operator[](const char *key) const
{
	return this->operator[](std::string(key));
}
Json& Json::operator[](const char *key)
{
	return this->operator[](std::string(key));
}

const Json* Json::find(const std::string &key) const noexcept
{
	if (isObject())
		for (auto iter = std::get<json_object>(m_data).begin(); iter < std::get<json_object>(m_data).end(); iter++)
			if (iter->first == key)
				return &(iter->second);
	return nullptr;
}
Json* Json::find(const std::string &key) noexcept
{
	if (isObject())
		for (auto iter = std::get<json_object>(m_data).begin(); iter < std::get<json_object>(m_data).end(); iter++)
			if (iter->first == key)
				return &(iter->second);
	return nullptr;
}
const std::pair<std::string, Json>& Json::entry(int idx) const
{
	const json_object &object = as_object();
	if (idx < 0 or idx >= static_cast<int>(object.size()))
		throw mls::IndexOutOfBounds(METHOD_NAME, "idx", idx, static_cast<int>(object.size()));
	return object[idx];
}

int Json::size() const noexcept
{
	switch (get_type())
	{
		case JsonType::Null:
			return 0;
		case JsonType::Array:
			return static_cast<int>(std::get<json_array>(m_data).size());
		case JsonType::Object:
			return static_cast<int>(std::get<json_object>(m_data).size());
		default:
			return 1;
	}
}
bool Json::isEmpty() const noexcept
{
	switch (get_type())
	{
		case JsonType::Null:
			return true;
		case JsonType::Array:
			return std::get<json_array>(m_data).empty();
		case JsonType::Object:
			return std::get<json_object>(m_data).empty();
		default:
			return false;
	}
}
const char* Json::storedType() const noexcept
{
	switch (get_type())
	{
		case JsonType::Null:
			return "null";
		case JsonType::Bool:
			return "bool";
		case JsonType::Number:
			return "number";
		case JsonType::String:
			return "string";
		case JsonType::Array:
			return "array";
		case JsonType::Object:
			return "object";
		default:
			return "unknown";
	}
}

std::string Json::dump(int indent) const
{
	JsonSerializer serializer(indent);
	serializer.dump(*this);
	return serializer.getString();
}
Json Json::load(const std::string &str)
{
	JsonDeserializer deserializer(str);
	return deserializer.loadDocument();
}

//private
JsonType Json::get_type() const noexcept
{
	return static_cast<JsonType>(m_data.index());
}
const Json::json_array& Json::as_array() const
{
	if (not isArray())
		throw JsonTypeError(METHOD_NAME, storedType());
	return std::get<json_array>(m_data);
}
Json::json_array& Json::as_array()
{
	if (not isArray())
		throw JsonTypeError(METHOD_NAME, storedType());
	return std::get<json_array>(m_data);
}
const Json::json_object& Json::as_object() const
{
	if (not isObject())
		throw JsonTypeError(METHOD_NAME, storedType());
	return std::get<json_object>(m_data);
}
Json::json_object& Json::as_object()
{
	if (not isObject())
		throw JsonTypeError(METHOD_NAME, storedType());
	return std::get<json_object>(m_data);
}

JsonKeyError::JsonKeyError(const char *method, const std::string &key) :
		std::logic_error(std::string(method) + " : key '" + key + "' not found")
{
}
JsonTypeError::JsonTypeError(const char *method, const char *current_type) :
		std::logic_error(std::string(method) + " : currently stored type is " + current_type)
{
}
JsonParsingError::JsonParsingError(const char *method, const std::string &message, size_t offset) :
		std::logic_error(std::string(method) + " : " + message + " at offset " + std::to_string(offset))
{
}
