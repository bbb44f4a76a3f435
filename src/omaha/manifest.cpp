// manifest.cpp - Reading and writing the update server configuration list.

#include "omaha/manifest.hpp"

#include "io/file_copy.hpp"
#include "util/logger.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/stat.h>

namespace fpack {

namespace {

// Recursive-descent reader over the list-literal syntax.
class ManifestLexer {
  public:
    explicit ManifestLexer(std::string_view text) : text_(text) {}

    void SkipSpace() {
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c == '#') {
                while (pos_ < text_.size() && text_[pos_] != '\n') ++pos_;
            } else if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
            } else {
                break;
            }
        }
    }

    bool AtEnd() {
        SkipSpace();
        return pos_ >= text_.size();
    }

    bool Accept(char c) {
        SkipSpace();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool AcceptWord(std::string_view word) {
        SkipSpace();
        if (text_.substr(pos_, word.size()) != word) return false;
        const size_t end = pos_ + word.size();
        if (end < text_.size() && IsTokenChar(text_[end])) return false;
        pos_ = end;
        return true;
    }

    char Peek() {
        SkipSpace();
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    std::expected<std::string, std::string> QuotedString() {
        SkipSpace();
        if (pos_ >= text_.size() || (text_[pos_] != '\'' && text_[pos_] != '"')) {
            return std::unexpected(Where("expected a quoted string"));
        }
        const char quote = text_[pos_++];
        std::string out;
        while (pos_ < text_.size()) {
            const char c = text_[pos_++];
            if (c == quote) return out;
            if (c == '\\' && pos_ < text_.size()) {
                DecodeEscape(out);
            } else if (c == '\n') {
                break;
            } else {
                out.push_back(c);
            }
        }
        return std::unexpected(Where("unterminated string"));
    }

    std::expected<std::string, std::string> BareToken() {
        SkipSpace();
        const size_t start = pos_;
        while (pos_ < text_.size() && IsTokenChar(text_[pos_])) ++pos_;
        if (pos_ == start) return std::unexpected(Where("expected a value"));
        return std::string(text_.substr(start, pos_ - start));
    }

    std::string Where(std::string_view what) const {
        size_t line = 1;
        for (size_t i = 0; i < pos_ && i < text_.size(); ++i) {
            if (text_[i] == '\n') ++line;
        }
        return "line " + std::to_string(line) + ": " + std::string(what);
    }

  private:
    // Python string escapes. Unknown ones keep their backslash, as Python does.
    void DecodeEscape(std::string& out) {
        const char e = text_[pos_++];
        switch (e) {
            case 'n':  out.push_back('\n'); return;
            case 't':  out.push_back('\t'); return;
            case 'r':  out.push_back('\r'); return;
            case '\\': case '\'': case '"': out.push_back(e); return;
            case 'x':
                if (pos_ + 2 <= text_.size() && std::isxdigit(static_cast<unsigned char>(text_[pos_])) &&
                    std::isxdigit(static_cast<unsigned char>(text_[pos_ + 1]))) {
                    out.push_back(static_cast<char>(std::stoi(std::string(text_.substr(pos_, 2)), nullptr, 16)));
                    pos_ += 2;
                    return;
                }
                break;
            default:
                if (e >= '0' && e <= '7') {
                    int value = e - '0';
                    for (int i = 0; i < 2 && pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '7'; ++i) {
                        value = value * 8 + (text_[pos_++] - '0');
                    }
                    out.push_back(static_cast<char>(value & 0xff));
                    return;
                }
                break;
        }
        out.push_back('\\');
        out.push_back(e);
    }

    static bool IsTokenChar(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-' ||
               c == '+';
    }

    std::string_view text_;
    size_t pos_ = 0;
};

std::expected<ManifestValue, std::string> ParseValue(ManifestLexer& lex) {
    const char c = lex.Peek();
    if (c == '\'' || c == '"') {
        auto s = lex.QuotedString();
        if (!s) return std::unexpected(s.error());
        return ManifestValue::Str(std::move(*s));
    }
    if (lex.AcceptWord("set")) {
        if (!lex.Accept('(') || !lex.Accept('[')) {
            return std::unexpected(lex.Where("expected set([...])"));
        }
        std::vector<std::string> items;
        while (!lex.Accept(']')) {
            auto s = lex.QuotedString();
            if (!s) return std::unexpected(s.error());
            items.push_back(std::move(*s));
            if (!lex.Accept(',') && lex.Peek() != ']') {
                return std::unexpected(lex.Where("expected ',' or ']' in set"));
            }
        }
        if (!lex.Accept(')')) return std::unexpected(lex.Where("expected ')' after set"));
        return ManifestValue::SetOf(std::move(items));
    }
    auto token = lex.BareToken();
    if (!token) return std::unexpected(token.error());
    return ManifestValue{.kind = ManifestValue::Kind::Raw, .text = std::move(*token)};
}

std::expected<ManifestGroup, std::string> ParseGroup(ManifestLexer& lex) {
    ManifestGroup group;
    while (true) {
        if (lex.AtEnd()) return std::unexpected(lex.Where("unterminated group"));
        if (lex.Accept('}')) return group;

        auto key = lex.QuotedString();
        if (!key) return std::unexpected(key.error());
        if (!lex.Accept(':')) return std::unexpected(lex.Where("expected ':' after '" + *key + "'"));
        auto value = ParseValue(lex);
        if (!value) return std::unexpected(value.error());
        group.Set(std::move(*key), std::move(*value));

        if (!lex.Accept(',') && lex.Peek() != '}') {
            if (lex.AtEnd()) return std::unexpected(lex.Where("unterminated group"));
            return std::unexpected(lex.Where("expected ',' or '}'"));
        }
    }
}

std::string Quote(std::string_view s, char quote) {
    std::string out(1, quote);
    for (char c : s) {
        switch (c) {
            case '\n': out += "\\n"; continue;
            case '\t': out += "\\t"; continue;
            case '\r': out += "\\r"; continue;
            default: break;
        }
        if (c == quote || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            char hex[5];
            std::snprintf(hex, sizeof(hex), "\\x%02x", static_cast<unsigned char>(c));
            out += hex;
        } else {
            out.push_back(c);
        }
    }
    out.push_back(quote);
    return out;
}

std::string FormatValue(const ManifestValue& v) {
    switch (v.kind) {
        case ManifestValue::Kind::String:
            return Quote(v.text, '\'');
        case ManifestValue::Kind::Raw:
            return v.text;
        case ManifestValue::Kind::Set: {
            std::string out = "set([";
            for (size_t i = 0; i < v.items.size(); ++i) {
                if (i) out += ", ";
                out += Quote(v.items[i], '"');
            }
            return out + "])";
        }
    }
    return {};
}

} // namespace

void ManifestGroup::Set(std::string key, ManifestValue value) {
    for (auto& [k, v] : entries) {
        if (k == key) {
            v = std::move(value);
            return;
        }
    }
    entries.emplace_back(std::move(key), std::move(value));
}

const ManifestValue* ManifestGroup::Find(std::string_view key) const {
    for (const auto& [k, v] : entries) {
        if (k == key) return &v;
    }
    return nullptr;
}

std::expected<ManifestDocument, std::string> ManifestDocument::Parse(std::string_view text) {
    ManifestDocument doc;
    ManifestLexer lex(text);
    if (lex.AtEnd()) return doc;

    if (!lex.AcceptWord("config") || !lex.Accept('=') || !lex.Accept('[')) {
        return std::unexpected(lex.Where("expected 'config = ['"));
    }

    while (true) {
        if (lex.AtEnd()) return doc;  // truncated before ']'
        if (lex.Accept(']')) break;
        if (!lex.Accept('{')) return std::unexpected(lex.Where("expected '{' or ']'"));

        auto group = ParseGroup(lex);
        if (!group) return std::unexpected(group.error());
        doc.groups.push_back(std::move(*group));

        if (!lex.Accept(',') && lex.Peek() != ']' && !lex.AtEnd()) {
            return std::unexpected(lex.Where("expected ',' after group"));
        }
    }

    if (!lex.AtEnd()) return std::unexpected(lex.Where("unexpected text after ']'"));
    return doc;
}

std::string ManifestDocument::Serialize() const {
    std::string out = "config = [\n";
    for (const auto& group : groups) {
        out += "{";
        for (const auto& [key, value] : group.entries) {
            out += "\n   " + Quote(key, '\'') + ": " + FormatValue(value) + ",";
        }
        out += "\n },\n";
    }
    out += "]\n";
    return out;
}

ManifestGroup BuildGroup(const ManifestRecord& rec) {
    const std::string prefix = rec.subfolder.empty() ? std::string() : rec.subfolder + "/";
    ManifestGroup g;
    auto add = [&](const char* name, const char* file, const std::string& checksum) {
        g.Set(std::string(name) + "_image", ManifestValue::Str(prefix + file));
        g.Set(std::string(name) + "_checksum", ManifestValue::Str(checksum));
    };

    g.Set("qual_ids", ManifestValue::SetOf({rec.board}));
    add("factory", artifact::kFactoryRootfs, rec.factory_checksum);
    add("release", artifact::kReleaseRootfs, rec.release_checksum);
    add("oempartitionimg", artifact::kOem, rec.oem_checksum);
    add("efipartitionimg", artifact::kEfi, rec.efi_checksum);
    add("stateimg", artifact::kState, rec.state_checksum);
    if (rec.firmware_checksum) add("firmware", artifact::kFirmware, *rec.firmware_checksum);
    if (rec.hwid_checksum) add("hwid", artifact::kHwid, *rec.hwid_checksum);
    if (rec.complete_checksum) add("complete", artifact::kComplete, *rec.complete_checksum);
    return g;
}

Result ManifestAggregator::Record(const std::string& path, const ManifestGroup& group, bool append) const {
    ManifestDocument doc;

    struct stat st{};
    if (append && ::stat(path.c_str(), &st) == 0) {
        std::string text;
        if (auto r = ReadWholeFile(path, text); !r.is_ok()) return r;
        auto parsed = ManifestDocument::Parse(text);
        if (!parsed) {
            return Result::Fail(EBADMSG, "Malformed manifest " + path + ": " + parsed.error());
        }
        doc = std::move(*parsed);
        LogInfo("Appending to %s (%zu existing groups)", path.c_str(), doc.groups.size());
    }
    doc.groups.push_back(group);

    const std::string text = doc.Serialize();
    const std::string tmp = path + ".tmp";
    if (auto r = WriteWholeFile(tmp, text); !r.is_ok()) {
        std::remove(tmp.c_str());
        return r;
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        const int e = errno;
        std::remove(tmp.c_str());
        return Result::Fail(e, "Cannot replace " + path + " (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

} // namespace fpack
