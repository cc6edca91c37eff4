#include "json_format.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <map>
#include <sstream>
#include <streambuf>
#include <vector>

namespace fs = std::filesystem;

namespace {
    constexpr int INDENT_WIDTH = 2;
    constexpr std::size_t BLOCK_SIZE = 8192;

    // long double floats so the lexer accepts exponents beyond double's range;
    // the value itself is never printed, only the token text.
    using TokenJson = nlohmann::basic_json<std::map, std::vector, std::string, bool,
                                           std::int64_t, std::uint64_t, long double>;

    // Exposes an EntryStream to std::istream consumers.
    class EntryStreamBuf : public std::streambuf {
    public:
        explicit EntryStreamBuf(EntryStream& source) : source_(source), block_(BLOCK_SIZE) {}

    protected:
        int_type underflow() override {
            if (gptr() < egptr()) {
                return traits_type::to_int_type(*gptr());
            }
            std::size_t n = source_.read(block_.data(), block_.size());
            if (n == 0) {
                return traits_type::eof();
            }
            setg(block_.data(), block_.data(), block_.data() + n);
            return traits_type::to_int_type(*gptr());
        }

    private:
        EntryStream& source_;
        std::vector<char> block_;
    };

    // SAX consumer that prints every token as it arrives, in the layout of
    // nlohmann's dump(2).
    class IndentingWriter {
    public:
        using number_integer_t = TokenJson::number_integer_t;
        using number_unsigned_t = TokenJson::number_unsigned_t;
        using number_float_t = TokenJson::number_float_t;
        using string_t = TokenJson::string_t;
        using binary_t = TokenJson::binary_t;

        explicit IndentingWriter(std::ostream& out) : out_(out) {}

        bool null() { return scalar("null"); }
        bool boolean(bool val) { return scalar(val ? "true" : "false"); }
        bool number_integer(number_integer_t val) { return scalar(std::to_string(val)); }
        bool number_unsigned(number_unsigned_t val) { return scalar(std::to_string(val)); }
        bool number_float(number_float_t, const string_t& raw) { return scalar(raw); }
        bool string(string_t& val) { return scalar(quote(val)); }
        bool binary(binary_t&) { return false; }

        bool start_object(std::size_t) { return open('{'); }
        bool end_object() { return close('}'); }
        bool start_array(std::size_t) { return open('['); }
        bool end_array() { return close(']'); }

        bool key(string_t& val) {
            next_member();
            out_ << quote(val) << ": ";
            after_key_ = true;
            return true;
        }

        bool parse_error(std::size_t, const std::string&, const nlohmann::detail::exception& ex) {
            error_ = ex.what();
            return false;
        }

        const std::string& error() const { return error_; }

    private:
        static std::string quote(const string_t& val) {
            return TokenJson(val).dump();
        }

        void newline() {
            out_ << '\n' << std::string(has_members_.size() * INDENT_WIDTH, ' ');
        }

        void next_member() {
            if (has_members_.back()) out_ << ',';
            has_members_.back() = true;
            newline();
        }

        // Values after a key stay on the key's line; array elements get their own.
        void begin_value() {
            if (after_key_) {
                after_key_ = false;
            } else if (!has_members_.empty()) {
                next_member();
            }
        }

        bool scalar(const std::string& text) {
            begin_value();
            out_ << text;
            return true;
        }

        bool open(char bracket) {
            begin_value();
            out_ << bracket;
            has_members_.push_back(false);
            return true;
        }

        bool close(char bracket) {
            bool had_members = has_members_.back();
            has_members_.pop_back();
            if (had_members) newline();
            out_ << bracket;
            return true;
        }

        std::ostream& out_;
        std::vector<bool> has_members_;
        bool after_key_ = false;
        std::string error_;
    };
}

void reformat_json(std::istream& in, std::ostream& out) {
    IndentingWriter writer(out);
    if (!TokenJson::sax_parse(in, &writer)) {
        throw UnpackException(UnpackErrc::JsonFormat, get_string("error.json_format_failed") + ": " + writer.error());
    }
}

std::string format_json(const std::string& text) {
    std::istringstream in(text);
    std::ostringstream out;
    reformat_json(in, out);
    return out.str();
}

void write_pretty_json(EntryStream& in, const fs::path& target) {
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw UnpackException(UnpackErrc::EntryWrite, string_format("error.create_file_failed", target.string()));
    }

    EntryStreamBuf buffer(in);
    std::istream source(&buffer);
    reformat_json(source, out);
    out << '\n';
    out.close();
    if (!out) {
        throw UnpackException(UnpackErrc::EntryWrite, string_format("error.write_file_failed", target.string()));
    }
}
