#include "capsync/cli/options.hpp"

#include <charconv>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace capsync::cli {
    namespace {
        using capsync::core::Status;

        [[nodiscard]] constexpr Status cli_invalid() noexcept {
            return capsync::core::make_status(capsync::core::StatusDomain::Cli, capsync::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name) noexcept {
            if (name == nullptr) {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strcmp(s.long_name, name) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.short_name == c) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool parse_f64(const char* s, double* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            errno = 0;
            char* end = nullptr;
            const double v = std::strtod(s, &end);
            if (end == s || end == nullptr || *end != '\0' || errno != 0) {
                return false;
            }
            *out = v;
            return true;
        }

        // Converts `value` per the option's type into opt.
        [[nodiscard]] Status decode_value(const OptionSpec& spec, const char* value, ParsedOption* opt) noexcept {
            switch (spec.type) {
                case OptionType::String:
                    opt->value.str = value;
                    return capsync::core::ok_status();
                case OptionType::I64: {
                    i64 v{};
                    if (!parse_i64(value, &v)) {
                        return cli_invalid();
                    }
                    opt->value.i64v = v;
                    return capsync::core::ok_status();
                }
                case OptionType::F64: {
                    double v{};
                    if (!parse_f64(value, &v)) {
                        return cli_invalid();
                    }
                    opt->value.f64v = v;
                    return capsync::core::ok_status();
                }
                case OptionType::Flag:
                    break;
            }
            return cli_invalid();
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return cli_invalid();
            }
            out->data[out->len++] = opt;
            return capsync::core::ok_status();
        }
    } // namespace

    capsync::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return cli_invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return cli_invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return cli_invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr) {
                break;
            }
            if (tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* value = nullptr;
            bool inline_value = false;

            if (tok[1] == '-') {
                const char* name = tok + 2;
                char name_buf[128]{};
                const char* eq = std::strchr(name, '=');
                if (eq != nullptr) {
                    const size_t name_len = static_cast<size_t>(eq - name);
                    if (name_len == 0 || name_len >= sizeof(name_buf)) {
                        return cli_invalid();
                    }
                    std::memcpy(name_buf, name, name_len);
                    name_buf[name_len] = '\0';
                    name = name_buf;
                    value = eq + 1;
                    inline_value = true;
                }
                spec = find_long(specs, spec_count, name);
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    value = tok + 2;
                    inline_value = true;
                }
            }
            if (spec == nullptr) {
                return cli_invalid();
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;

            if (spec->type == OptionType::Flag) {
                if (inline_value) {
                    return cli_invalid();
                }
                opt.value.boolv = 1;
                ++i;
            } else {
                if (inline_value) {
                    ++i;
                } else {
                    if (i + 1 >= args.argc || args.argv[i + 1] == nullptr) {
                        return cli_invalid();
                    }
                    value = args.argv[i + 1];
                    i += 2;
                }
                const Status s = decode_value(*spec, value, &opt);
                if (!capsync::core::is_ok(s)) {
                    return s;
                }
            }

            const Status s = push_option(out, opt);
            if (!capsync::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return capsync::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace capsync::cli
