/*
 * json.cpp
 *
 *  Created on: Sep 18, 2026
 */

#include <moxe/utils/json.hpp>
#include <moxe/core/moxe_exceptions.hpp>

#include <cstring>
#include <cstdio>
#include <cstdlib>
#include <cctype>
#include <cmath>
#include <algorithm>
#include <cassert>

namespace
{
	class JsonSerializer
	{
			std::string m_data;
			const int m_indent_step;
			const bool m_pretty_print;
		public:
			explicit JsonSerializer(int indent) :
					m_indent_step(indent),
					m_pretty_print(indent >= 0)
			{
				m_data.reserve(1024);
			}
			void dump(const Json &json, int current_indent = 0)
			{
				if (json.isNull())
					m_data += "null";
				if (json.isBool())
					m_data += json.getBool() ? "true" : "false";
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
				return m_data;
			}
		private:
			void new_line(int indent)
			{
				if (m_pretty_print)
				{
					m_data += '\n';
					m_data.append(indent, ' ');
				}
			}
			void write_number(double d)
			{
				char buffer[32];
				std::snprintf(buffer, sizeof(buffer), "%.17g", d);
				m_data += buffer;
			}
			void write_string(const std::string &str)
			{
				m_data += '\"';
				m_data += str;
				m_data += '\"';
			}
			void write_array(const Json &json, int current_indent)
			{
				if (json.size() == 0)
				{
					m_data += "[]";
					return;
				}
				m_data += '[';
				for (int i = 0; i < json.size(); i++)
				{
					if (i != 0)
						m_data += ',';
					new_line(current_indent + m_indent_step);
					dump(json[i], current_indent + m_indent_step);
				}
				new_line(current_indent);
				m_data += ']';
			}
			void write_object(const Json &json, int current_indent)
			{
				if (json.size() == 0)
				{
					m_data += "{}";
					return;
				}
				m_data += '{';
				for (int i = 0; i < json.size(); i++)
				{
					if (i != 0)
						m_data += ',';
					new_line(current_indent + m_indent_step);
					write_string(json.entry(i).first);
					m_data += m_pretty_print ? ": " : ":";
					dump(json.entry(i).second, current_indent + m_indent_step);
				}
				new_line(current_indent);
				m_data += '}';
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
			Json load()
			{
				Json result = load_value();
				skip_spaces();
				if (m_offset != m_data.size())
					throw JsonParsingError(METHOD_NAME, "unexpected trailing characters at offset " + std::to_string(m_offset));
				return result;
			}
		private:
			void skip_spaces() noexcept
			{
				while (m_offset < m_data.size() and std::isspace(static_cast<unsigned char>(m_data[m_offset])))
					m_offset++;
			}
			char peek()
			{
				skip_spaces();
				if (m_offset >= m_data.size())
					throw JsonParsingError(METHOD_NAME, "unexpected end of input");
				return m_data[m_offset];
			}
			void expect(char c)
			{
				if (peek() != c)
					throw JsonParsingError(METHOD_NAME, std::string("expected '") + c + "' at offset " + std::to_string(m_offset));
				m_offset++;
			}
			Json load_value()
			{
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
			Json load_object()
			{
				expect('{');
				Json result(JsonType::Object);
				if (peek() == '}')
				{
					m_offset++;
					return result;
				}
				while (true)
				{
					const std::string key = load_string();
					expect(':');
					result[key] = load_value();
					if (peek() == ',')
						m_offset++;
					else
					{
						expect('}');
						return result;
					}
				}
			}
			Json load_array()
			{
				expect('[');
				Json result(JsonType::Array);
				if (peek() == ']')
				{
					m_offset++;
					return result;
				}
				while (true)
				{
					result[result.size()] = load_value();
					if (peek() == ',')
						m_offset++;
					else
					{
						expect(']');
						return result;
					}
				}
			}
			std::string load_string()
			{
				expect('\"');
				const size_t start = m_offset;
				bool is_escape_character = false;
				for (; m_offset < m_data.size(); m_offset++)
				{
					if (is_escape_character)
						is_escape_character = false;
					else
					{
						if (m_data[m_offset] == '\"')
						{
							m_offset++;
							return m_data.substr(start, m_offset - 1 - start);
						}
						if (m_data[m_offset] == '\\')
							is_escape_character = true;
					}
				}
				throw JsonParsingError(METHOD_NAME, "string never ended");
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

				char *end = nullptr;
				const double value = std::strtod(str, &end);
				if (end == str or value == HUGE_VAL or value == -HUGE_VAL)
					throw JsonParsingError(METHOD_NAME, "not a primitive type at offset " + std::to_string(m_offset));
				m_offset += static_cast<size_t>(end - str);
				return Json(value);
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
Json::Json(const std::initializer_list<Json> &list)
{
	const bool is_object = std::all_of(list.begin(), list.end(), [](const Json &element)
	{
		return element.isArray() and element.size() == 2 and element[0].isString();
	});

	if (is_object and list.size() > 0)
	{
		json_object tmp;
		for (auto element = list.begin(); element < list.end(); element++)
			tmp.push_back(key_value_pair((*element)[0].getString(), (*element)[1]));
		m_data = tmp;
	}
	else
		m_data = json_array(list);
}
Json::Json(const int *list, size_t length) :
		m_data(json_array(list, list + length))
{
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
	if (not isArray())
		throw JsonTypeError(METHOD_NAME, storedType());
	if (idx < 0 or idx >= size())
		throw moxe::IndexOutOfBounds(METHOD_NAME, "idx", idx, size());
	return as_array()[idx];
}
Json& Json::operator[](int idx)
{
	if (isNull()) // null json can be turned into an array
		m_data = json_array();
	if (not isArray())
		throw JsonTypeError(METHOD_NAME, storedType());
	if (idx < 0)
		throw moxe::IndexOutOfBounds(METHOD_NAME, "idx", idx, size());

	if (static_cast<size_t>(idx) >= as_array().size()) // missing elements are created as null json
		as_array().resize(1 + idx);
	return as_array()[idx];
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
	if (not isObject())
		throw JsonTypeError(METHOD_NAME, storedType());
	Json *element = find(key);
	if (element != nullptr)
		return *element;
	as_object().push_back(key_value_pair(key, Json()));
	return as_object().back().second;
}
const Json& Json::operator[](const char *key) const
{
	return this->operator [](std::string(key));
}
Json& Json::operator[](const char *key)
{
	return this->operator [](std::string(key));
}

const Json* Json::find(const std::string &key) const noexcept
{
	if (isObject())
		for (auto element = as_object().begin(); element < as_object().end(); element++)
			if (element->first == key)
				return &(element->second);
	return nullptr;
}
Json* Json::find(const std::string &key) noexcept
{
	if (isObject())
		for (auto element = as_object().begin(); element < as_object().end(); element++)
			if (element->first == key)
				return &(element->second);
	return nullptr;
}
bool Json::hasKey(const std::string &key) const
{
	if (not isObject())
		throw JsonTypeError(METHOD_NAME, storedType());
	return find(key) != nullptr;
}
const std::pair<std::string, Json>& Json::entry(int idx) const
{
	if (not isObject())
		throw JsonTypeError(METHOD_NAME, storedType());
	if (idx < 0 or idx >= size())
		throw moxe::IndexOutOfBounds(METHOD_NAME, "idx", idx, size());
	return as_object()[idx];
}

int Json::size() const
{
	switch (get_type())
	{
		case JsonType::Null:
			return 0;
		case JsonType::Array:
			return static_cast<int>(as_array().size());
		case JsonType::Object:
			return static_cast<int>(as_object().size());
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
			return as_array().empty();
		case JsonType::Object:
			return as_object().empty();
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
	return deserializer.load();
}

//private
JsonType Json::get_type() const noexcept
{
	return static_cast<JsonType>(m_data.index());
}
const Json::json_array& Json::as_array() const noexcept
{
	assert(isArray());
	return std::get<json_array>(m_data);
}
Json::json_array& Json::as_array() noexcept
{
	assert(isArray());
	return std::get<json_array>(m_data);
}
const Json::json_object& Json::as_object() const noexcept
{
	assert(isObject());
	return std::get<json_object>(m_data);
}
Json::json_object& Json::as_object() noexcept
{
	assert(isObject());
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
JsonParsingError::JsonParsingError(const char *method, const std::string &message) :
		std::logic_error(std::string(method) + " : " + message)
{
}
