#include "traceproxy/trace/TraceJson.h"

#include <openssl/evp.h>

#include <cstdlib>
#include <map>
#include <memory>

namespace traceproxy {
namespace trace {

std::string TraceJson::Escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out.push_back(hex[(c >> 4) & 0xF]);
                    out.push_back(hex[c & 0xF]);
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

std::string TraceJson::Base64Encode(const std::string& data) {
    if (data.empty()) return std::string();
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

bool TraceJson::Base64Decode(const std::string& text, std::string* out) {
    out->clear();
    if (text.empty()) return true;
    if (text.size() % 4 != 0) return false;
    std::string buf(3 * text.size() / 4 + 1, '\0');
    const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&buf[0]),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (n < 0) return false;
    // EVP_DecodeBlock counts padding bytes as data.
    size_t len = static_cast<size_t>(n);
    if (text[text.size() - 1] == '=') --len;
    if (text[text.size() - 2] == '=') --len;
    buf.resize(len);
    *out = std::move(buf);
    return true;
}

namespace {

void AppendAddress(std::string& out, const char* key, const SocketAddress& a, const char* indent) {
    out += indent;
    out += "\"";
    out += key;
    out += "\": {\"addr\": \"" + TraceJson::Escape(a.addr) + "\", \"port\": " + std::to_string(a.port) + "},\n";
}

// Minimal JSON reader for the subset Encode produces (objects, arrays, strings, integers,
// booleans, null).
struct JsonValue {
    enum Type { kNull, kBool, kNumber, kString, kArray, kObject };
    Type type{kNull};
    bool b{false};
    long long n{0};
    std::string s;
    std::vector<JsonValue> arr;
    std::map<std::string, JsonValue> obj;

    const JsonValue* Get(const std::string& key) const {
        auto it = obj.find(key);
        return it == obj.end() ? nullptr : &it->second;
    }
};

class JsonReader {
public:
    explicit JsonReader(const std::string& text) : text_(text) {}

    bool ParseDocument(JsonValue* out) {
        if (!ParseValue(out, 0)) return false;
        SkipWs();
        if (pos_ != text_.size()) return Fail("trailing characters");
        return true;
    }

    const std::string& error() const { return error_; }

private:
    static const int kMaxDepth = 32;

    bool Fail(const std::string& msg) {
        if (error_.empty()) error_ = msg + " at offset " + std::to_string(pos_);
        return false;
    }

    void SkipWs() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\n' || text_[pos_] == '\r' || text_[pos_] == '\t')) {
            ++pos_;
        }
    }

    bool Consume(char c) {
        SkipWs();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool Literal(const char* word) {
        const std::string w(word);
        if (text_.compare(pos_, w.size(), w) == 0) {
            pos_ += w.size();
            return true;
        }
        return false;
    }

    bool ParseValue(JsonValue* out, int depth) {
        if (depth > kMaxDepth) return Fail("nesting too deep");
        SkipWs();
        if (pos_ >= text_.size()) return Fail("unexpected end");
        const char c = text_[pos_];
        if (c == '{') return ParseObject(out, depth);
        if (c == '[') return ParseArray(out, depth);
        if (c == '"') {
            out->type = JsonValue::kString;
            return ParseString(&out->s);
        }
        if (c == '-' || (c >= '0' && c <= '9')) return ParseNumber(out);
        if (Literal("true")) {
            out->type = JsonValue::kBool;
            out->b = true;
            return true;
        }
        if (Literal("false")) {
            out->type = JsonValue::kBool;
            out->b = false;
            return true;
        }
        if (Literal("null")) {
            out->type = JsonValue::kNull;
            return true;
        }
        return Fail("unexpected character");
    }

    bool ParseObject(JsonValue* out, int depth) {
        out->type = JsonValue::kObject;
        ++pos_;
        if (Consume('}')) return true;
        do {
            SkipWs();
            std::string key;
            if (pos_ >= text_.size() || text_[pos_] != '"') return Fail("expected key");
            if (!ParseString(&key)) return false;
            if (!Consume(':')) return Fail("expected ':'");
            JsonValue v;
            if (!ParseValue(&v, depth + 1)) return false;
            out->obj[key] = std::move(v);
        } while (Consume(','));
        if (!Consume('}')) return Fail("expected '}'");
        return true;
    }

    bool ParseArray(JsonValue* out, int depth) {
        out->type = JsonValue::kArray;
        ++pos_;
        if (Consume(']')) return true;
        do {
            JsonValue v;
            if (!ParseValue(&v, depth + 1)) return false;
            out->arr.push_back(std::move(v));
        } while (Consume(','));
        if (!Consume(']')) return Fail("expected ']'");
        return true;
    }

    bool ParseString(std::string* out) {
        ++pos_;  // opening quote
        while (pos_ < text_.size()) {
            const char c = text_[pos_++];
            if (c == '"') return true;
            if (c != '\\') {
                out->push_back(c);
                continue;
            }
            if (pos_ >= text_.size()) break;
            const char esc = text_[pos_++];
            switch (esc) {
                case '"': out->push_back('"'); break;
                case '\\': out->push_back('\\'); break;
                case '/': out->push_back('/'); break;
                case 'b': out->push_back('\b'); break;
                case 'f': out->push_back('\f'); break;
                case 'n': out->push_back('\n'); break;
                case 'r': out->push_back('\r'); break;
                case 't': out->push_back('\t'); break;
                case 'u': {
                    if (pos_ + 4 > text_.size()) return Fail("short \\u escape");
                    const std::string hex = text_.substr(pos_, 4);
                    pos_ += 4;
                    char* end = nullptr;
                    const long cp = std::strtol(hex.c_str(), &end, 16);
                    if (end != hex.c_str() + 4) return Fail("bad \\u escape");
                    // Only code points below 0x80 are produced by Escape.
                    if (cp < 0x80) {
                        out->push_back(static_cast<char>(cp));
                    } else if (cp < 0x800) {
                        out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
                        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                    } else {
                        out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
                        out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
                    }
                    break;
                }
                default:
                    return Fail("bad escape");
            }
        }
        return Fail("unterminated string");
    }

    bool ParseNumber(JsonValue* out) {
        const char* begin = text_.c_str() + pos_;
        char* end = nullptr;
        const long long v = std::strtoll(begin, &end, 10);
        if (end == begin) return Fail("bad number");
        pos_ += static_cast<size_t>(end - begin);
        out->type = JsonValue::kNumber;
        out->n = v;
        return true;
    }

    const std::string& text_;
    size_t pos_{0};
    std::string error_;
};

bool ReadAddress(const JsonValue* v, SocketAddress* out) {
    if (!v || v->type != JsonValue::kObject) return false;
    const JsonValue* addr = v->Get("addr");
    const JsonValue* port = v->Get("port");
    if (!addr || addr->type != JsonValue::kString || !port || port->type != JsonValue::kNumber) return false;
    if (port->n < 0 || port->n > 65535) return false;
    out->addr = addr->s;
    out->port = static_cast<uint16_t>(port->n);
    return true;
}

bool ReadEntry(const JsonValue& v, TraceEntry* e, std::string* why) {
    if (v.type != JsonValue::kObject) {
        *why = "entry is not an object";
        return false;
    }
    const JsonValue* dir = v.Get("direction");
    if (!dir || dir->type != JsonValue::kString || !ParseDirection(dir->s, &e->direction)) {
        *why = "bad direction";
        return false;
    }
    const JsonValue* session = v.Get("session");
    if (!session || session->type != JsonValue::kObject) {
        *why = "bad session";
        return false;
    }
    const JsonValue* sid = session->Get("id");
    const JsonValue* stime = session->Get("time");
    if (!sid || sid->type != JsonValue::kString || !stime || stime->type != JsonValue::kNumber) {
        *why = "bad session";
        return false;
    }
    e->session.id = sid->s;
    e->session.time = FromUnixMs(stime->n);

    if (!ReadAddress(v.Get("source"), &e->source) || !ReadAddress(v.Get("target"), &e->target)) {
        *why = "bad address";
        return false;
    }
    const JsonValue* si = v.Get("sourceIndex");
    const JsonValue* ti = v.Get("targetIndex");
    if (!si || si->type != JsonValue::kNumber || !ti || ti->type != JsonValue::kNumber) {
        *why = "bad index";
        return false;
    }
    e->sourceIndex = static_cast<int>(si->n);
    e->targetIndex = static_cast<int>(ti->n);

    const JsonValue* chunk = v.Get("chunk");
    if (chunk && chunk->type == JsonValue::kString) {
        std::string raw;
        if (!TraceJson::Base64Decode(chunk->s, &raw)) {
            *why = "bad chunk encoding";
            return false;
        }
        e->chunk = std::move(raw);
    } else if (!chunk || chunk->type == JsonValue::kNull) {
        e->chunk.reset();
    } else {
        *why = "bad chunk";
        return false;
    }

    const JsonValue* sent = v.Get("chunkSend");
    if (!sent || sent->type != JsonValue::kBool) {
        *why = "bad chunkSend";
        return false;
    }
    e->chunkSend = sent->b;

    const JsonValue* error = v.Get("error");
    if (error && error->type == JsonValue::kString) {
        e->error = error->s;
    } else {
        e->error.reset();
    }

    const JsonValue* time = v.Get("time");
    if (!time || time->type != JsonValue::kNumber) {
        *why = "bad time";
        return false;
    }
    e->time = FromUnixMs(time->n);
    return true;
}

} // namespace

std::string TraceJson::Encode(const std::vector<TraceEntry>& entries) {
    std::string out = "[";
    for (size_t i = 0; i < entries.size(); ++i) {
        const TraceEntry& e = entries[i];
        out += (i == 0) ? "\n" : ",\n";
        out += "  {\n";
        out += "    \"direction\": \"" + std::string(DirectionName(e.direction)) + "\",\n";
        out += "    \"session\": {\"id\": \"" + Escape(e.session.id) + "\", \"time\": " +
               std::to_string(ToUnixMs(e.session.time)) + "},\n";
        AppendAddress(out, "source", e.source, "    ");
        out += "    \"sourceIndex\": " + std::to_string(e.sourceIndex) + ",\n";
        AppendAddress(out, "target", e.target, "    ");
        out += "    \"targetIndex\": " + std::to_string(e.targetIndex) + ",\n";
        out += "    \"chunk\": " + (e.chunk ? "\"" + Base64Encode(*e.chunk) + "\"" : std::string("null")) + ",\n";
        out += "    \"chunkSend\": " + std::string(e.chunkSend ? "true" : "false") + ",\n";
        out += "    \"error\": " + (e.error ? "\"" + Escape(*e.error) + "\"" : std::string("null")) + ",\n";
        out += "    \"time\": " + std::to_string(ToUnixMs(e.time)) + "\n";
        out += "  }";
    }
    out += entries.empty() ? "]\n" : "\n]\n";
    return out;
}

bool TraceJson::Parse(const std::string& json, std::vector<TraceEntry>* out, std::string* err) {
    JsonValue doc;
    JsonReader reader(json);
    if (!reader.ParseDocument(&doc)) {
        if (err) *err = reader.error();
        return false;
    }
    if (doc.type != JsonValue::kArray) {
        if (err) *err = "top-level value is not an array";
        return false;
    }

    std::vector<TraceEntry> entries;
    entries.reserve(doc.arr.size());
    for (size_t i = 0; i < doc.arr.size(); ++i) {
        TraceEntry e;
        std::string why;
        if (!ReadEntry(doc.arr[i], &e, &why)) {
            if (err) *err = "entry " + std::to_string(i) + ": " + why;
            return false;
        }
        entries.push_back(std::move(e));
    }
    *out = std::move(entries);
    return true;
}

} // namespace trace
} // namespace traceproxy
