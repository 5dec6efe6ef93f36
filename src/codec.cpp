#include "echotest/codec.hpp"
#include "echotest/error.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace echotest {

namespace {

// Integers beyond 64 bits are valid JSON; nlohmann keeps them as doubles.
nlohmann::json parse_big_integer(std::string_view text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(std::string("Parse error: ") + e.what());
    }
}

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            simdjson::ondemand::number_type type = val.get_number_type();
            if (type == simdjson::ondemand::number_type::big_integer) {
                return parse_big_integer(val.raw_json_token());
            }
            simdjson::ondemand::number num = val.get_number();
            switch (num.get_number_type()) {
                case simdjson::ondemand::number_type::signed_integer:
                    return nlohmann::json(num.get_int64());
                case simdjson::ondemand::number_type::unsigned_integer:
                    return nlohmann::json(num.get_uint64());
                default:
                    return nlohmann::json(num.get_double());
            }
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(bool(val.get_bool()));
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            throw ParseError("Parse error: unexpected JSON token");
    }
}

// Scalar roots cannot be handed out as ondemand values; read them off the document.
nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc, std::string_view raw) {
    switch (doc.type()) {
        case simdjson::ondemand::json_type::object:
        case simdjson::ondemand::json_type::array:
            return simdjson_to_nlohmann(doc.get_value());
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = doc.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            simdjson::ondemand::number_type type = doc.get_number_type();
            // The whole line, so trailing content is still rejected
            if (type == simdjson::ondemand::number_type::big_integer) {
                return parse_big_integer(raw);
            }
            simdjson::ondemand::number num = doc.get_number();
            switch (num.get_number_type()) {
                case simdjson::ondemand::number_type::signed_integer:
                    return nlohmann::json(num.get_int64());
                case simdjson::ondemand::number_type::unsigned_integer:
                    return nlohmann::json(num.get_uint64());
                default:
                    return nlohmann::json(num.get_double());
            }
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(bool(doc.get_bool()));
        case simdjson::ondemand::json_type::null: {
            bool is_null = doc.is_null();
            if (!is_null) throw ParseError("Parse error: invalid null literal");
            return nlohmann::json(nullptr);
        }
        default:
            throw ParseError("Parse error: unexpected JSON token");
    }
}

} // anonymous namespace

nlohmann::json Codec::parse_line(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Parse error: empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(std::string("Parse error: ") + simdjson::error_message(error));
    }

    // On-demand parsing reports most syntax errors lazily, while walking the tree
    nlohmann::json j;
    try {
        j = simdjson_doc_to_nlohmann(doc, raw);
        // Scalar roots are checked for trailing content by simdjson itself
        if (j.is_structured() && !doc.at_end()) {
            throw ParseError("Parse error: trailing content after JSON value");
        }
    } catch (const ParseError&) {
        throw;
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(std::string("Parse error: ") + e.what());
    }
    return j;
}

std::string Codec::serialize(const JsonRpcResponse& resp) {
    nlohmann::json j;
    to_json(j, resp);
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Codec::dump_arguments(const nlohmann::json& arguments) {
    return arguments.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace echotest
