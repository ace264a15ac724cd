#include "BEncode.hpp"

#include <cctype>
#include <limits>

namespace {

constexpr size_t max_depth = 64;

}

BEncodeParser::BEncodeParser(std::string_view input) : _data(input), pos(0) {}

BEncodeValue BEncodeParser::parse() {
    auto v = parse_value();
    return v;
}

BEncodeValue BEncodeParser::parse_value() {
    if (pos >= _data.size()) throw BEncodeError("Unexpected end of input");
    char c = _data[pos];
    if (c == 'i') {
        return BEncodeValue{ parse_int() };
    } else if (c == 'l' || c == 'd') {
        if (++depth > max_depth) throw BEncodeError("Nesting too deep");
        ++pos;
        BEncodeValue v = (c == 'l') ? BEncodeValue{ parse_list() } : BEncodeValue{ parse_dict() };
        --depth;
        return v;
    } else if (std::isdigit(static_cast<unsigned char>(c))) {
        return BEncodeValue{ parse_string() };
    } else {
        throw BEncodeError(std::string("Invalid BEncode token: ") + c);
    }
}

// i-123e or i0e
int64_t BEncodeParser::parse_int() {
    ++pos; // skip 'i'
    bool neg = false;
    if (pos < _data.size() && _data[pos] == '-') {
        neg = true;
        ++pos;
    }
    if (pos >= _data.size() || !std::isdigit(static_cast<unsigned char>(_data[pos])))
        throw BEncodeError("Invalid integer");

    int64_t value = 0;
    if (_data[pos] == '0') {
        ++pos;
        if (neg) throw BEncodeError("Negative zero not allowed");
        if (pos < _data.size() && std::isdigit(static_cast<unsigned char>(_data[pos])))
            throw BEncodeError("Leading zeros not allowed");
    } else {
        while (pos < _data.size() && std::isdigit(static_cast<unsigned char>(_data[pos]))) {
            int digit = _data[pos] - '0';
            if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) throw BEncodeError("Integer overflow");
            value = value * 10 + digit;
            ++pos;
        }
    }
    if (pos >= _data.size() || _data[pos] != 'e') throw BEncodeError("Missing 'e' for integer");
    ++pos;
    return neg ? -value : value;
}

// <len>:<data>
std::string BEncodeParser::parse_string() {
    size_t colon = _data.find(':', pos);
    if (colon == std::string_view::npos) throw BEncodeError("Missing ':' in string");

    size_t len = 0;
    for (size_t i = pos; i < colon; ++i) {
        char ch = _data[i];
        if (!std::isdigit(static_cast<unsigned char>(ch))) throw BEncodeError("Invalid string length");
        len = len * 10 + (ch - '0');
        if (len > _data.size()) throw BEncodeError("String length exceeds input");
    }
    pos = colon + 1;
    if (len > _data.size() - pos) throw BEncodeError("String length exceeds input");

    std::string s(_data.substr(pos, len));
    pos += len;
    return s;
}

BEncodeValue::List BEncodeParser::parse_list() {
    BEncodeValue::List list;
    while (pos < _data.size() && _data[pos] != 'e') {
        list.push_back(parse_value());
    }
    if (pos >= _data.size()) throw BEncodeError("Missing 'e' at end of list");
    ++pos;
    return list;
}

BEncodeValue::Dict BEncodeParser::parse_dict() {
    BEncodeValue::Dict dict;
    while (pos < _data.size() && _data[pos] != 'e') {
        if (!std::isdigit(static_cast<unsigned char>(_data[pos]))) throw BEncodeError("Dictionary key must be a string");
        std::string key = parse_string();
        size_t val_start = pos;
        BEncodeValue value = parse_value();
        size_t val_end = pos;
        if (key == "info" && depth == 1) {
            _info_start = val_start;
            _info_end = val_end;
        }
        if (!dict.emplace(std::move(key), std::move(value)).second) throw BEncodeError("Duplicate dictionary key");
    }
    if (pos >= _data.size()) throw BEncodeError("Missing 'e' at end of dict");
    ++pos;
    return dict;
}

namespace {

void encode_to(std::string& out, const BEncodeValue& value) {
    if (value.is_int()) {
        out += 'i';
        out += std::to_string(value.as_int());
        out += 'e';
    }
    else if (value.is_string()) {
        const auto& s = value.as_string();
        out += std::to_string(s.size());
        out += ':';
        out += s;
    }
    else if (value.is_list()) {
        out += 'l';
        for (const auto& item: value.as_list()) encode_to(out, item);
        out += 'e';
    }
    else {
        // std::map keeps keys in the sorted order bencode requires
        out += 'd';
        for (const auto& [key, item]: value.as_dict()) {
            out += std::to_string(key.size());
            out += ':';
            out += key;
            encode_to(out, item);
        }
        out += 'e';
    }
}

}

std::string bencode(const BEncodeValue& value) {
    std::string out;
    encode_to(out, value);
    return out;
}
