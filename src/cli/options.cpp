#include "matreg/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace matreg::cli {
    namespace {
        [[nodiscard]] constexpr matreg::core::Status usage_error() noexcept {
            return matreg::core::make_status(matreg::core::StatusDomain::Cli, matreg::core::StatusCode::Invalid);
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
                if (specs[i].short_name == c) {
                    return &specs[i];
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

        [[nodiscard]] matreg::core::Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return usage_error();
            }
            out->data[out->len++] = opt;
            return matreg::core::ok_status();
        }

        // Converts value for spec and records it.
        [[nodiscard]] matreg::core::Status push_valued(ParsedOptions* out, const OptionSpec& spec, const char* value) noexcept {
            ParsedOption opt{};
            opt.id = spec.id;
            opt.type = spec.type;
            if (spec.type == OptionType::String) {
                opt.value.str = value;
            } else if (spec.type == OptionType::I64) {
                i64 v{};
                if (!parse_i64(value, &v)) {
                    return usage_error();
                }
                opt.value.i64v = v;
            } else {
                return usage_error();
            }
            return push_option(out, opt);
        }

        [[nodiscard]] matreg::core::Status push_flag(ParsedOptions* out, const OptionSpec& spec) noexcept {
            ParsedOption opt{};
            opt.id = spec.id;
            opt.type = OptionType::Flag;
            opt.value.boolv = 1;
            return push_option(out, opt);
        }

        // Value for the option at argv[*i]: inline when attached, otherwise the next token.
        [[nodiscard]] const char* take_value(const CliArgs& args, const char* attached, u32* i) noexcept {
            if (attached != nullptr) {
                ++*i;
                return attached;
            }
            if (*i + 1 >= args.argc || args.argv[*i + 1] == nullptr) {
                return nullptr;
            }
            const char* v = args.argv[*i + 1];
            *i += 2;
            return v;
        }

        // --name, --name=value, --name value
        [[nodiscard]] matreg::core::Status parse_long(const CliArgs& args,
            const OptionSpec* specs,
            u32 spec_count,
            ParsedOptions* out,
            u32* i) noexcept {
            const char* name = args.argv[*i] + 2;
            const char* attached = nullptr;
            char name_buf[64]{};
            if (const char* eq = std::strchr(name, '='); eq != nullptr) {
                const size_t name_len = static_cast<size_t>(eq - name);
                if (name_len == 0 || name_len >= sizeof(name_buf)) {
                    return usage_error();
                }
                std::memcpy(name_buf, name, name_len);
                name = name_buf;
                attached = eq + 1;
            }

            const OptionSpec* spec = find_long(specs, spec_count, name);
            if (spec == nullptr) {
                return usage_error();
            }
            if (spec->type == OptionType::Flag) {
                if (attached != nullptr) {
                    return usage_error();
                }
                ++*i;
                return push_flag(out, *spec);
            }
            const char* value = take_value(args, attached, i);
            return value == nullptr ? usage_error() : push_valued(out, *spec, value);
        }

        // -x, -xVALUE, -x VALUE
        [[nodiscard]] matreg::core::Status parse_short(const CliArgs& args,
            const OptionSpec* specs,
            u32 spec_count,
            ParsedOptions* out,
            u32* i) noexcept {
            const char* tok = args.argv[*i];
            const OptionSpec* spec = find_short(specs, spec_count, tok[1]);
            if (spec == nullptr) {
                return usage_error();
            }
            const char* attached = tok[2] != '\0' ? tok + 2 : nullptr;
            if (spec->type == OptionType::Flag) {
                if (attached != nullptr) {
                    return usage_error();
                }
                ++*i;
                return push_flag(out, *spec);
            }
            const char* value = take_value(args, attached, i);
            return value == nullptr ? usage_error() : push_valued(out, *spec, value);
        }
    } // namespace

    matreg::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return usage_error();
        }
        *consumed = 0;
        out->len = 0;
        if ((args.argc > 0 && args.argv == nullptr) || (spec_count > 0 && specs == nullptr)) {
            return usage_error();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            // A bare "-" or any non-dash token is the first positional.
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }
            const matreg::core::Status s = tok[1] == '-' ? parse_long(args, specs, spec_count, out, &i)
                                                         : parse_short(args, specs, spec_count, out, &i);
            if (!matreg::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return matreg::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        if (opts.data == nullptr) {
            return nullptr;
        }
        for (u32 i = opts.len; i > 0; --i) {
            if (opts.data[i - 1].id == id) {
                return &opts.data[i - 1];
            }
        }
        return nullptr;
    }
} // namespace matreg::cli
