#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unistd.h>
#include <vector>
#include "wirepack/wirepack.hpp"

using namespace wirepack;

// =============================================================================
// ANSI Color Support
// =============================================================================

namespace color {

namespace ansi {
    inline constexpr const char* reset   = "\033[0m";
    inline constexpr const char* bold    = "\033[1m";
    inline constexpr const char* dim     = "\033[2m";
    inline constexpr const char* red     = "\033[31m";
    inline constexpr const char* green   = "\033[32m";
    inline constexpr const char* yellow  = "\033[33m";
    inline constexpr const char* blue    = "\033[34m";
    inline constexpr const char* cyan    = "\033[36m";
} // namespace ansi

struct scheme_t {
    const char* reset   = ansi::reset;
    const char* header  = ansi::bold;
    const char* client  = ansi::cyan;
    const char* server  = ansi::blue;
    const char* size    = ansi::green;
    const char* dump    = ansi::dim;
    const char* warning = ansi::yellow;
    const char* error   = ansi::red;
};

inline auto enabled() -> scheme_t { return scheme_t{}; }
inline auto disabled() -> scheme_t {
    return scheme_t{"", "", "", "", "", "", "", ""};
}

inline auto is_tty(std::ostream& os) -> bool {
    if (&os == &std::cout) return isatty(STDOUT_FILENO) != 0;
    if (&os == &std::cerr) return isatty(STDERR_FILENO) != 0;
    return false;
}

inline auto for_stream(std::ostream& os) -> scheme_t {
    return is_tty(os) ? enabled() : disabled();
}

} // namespace color

// =============================================================================
// Message types
// =============================================================================

enum class procedure_kind { query, mutation, subscription };

inline const char* to_string(procedure_kind k) {
    switch (k) {
        case procedure_kind::query: return "query";
        case procedure_kind::mutation: return "mutation";
        case procedure_kind::subscription: return "subscription";
    }
    return "unknown";
}

inline procedure_kind from_string(std::type_identity<procedure_kind>, const std::string& s) {
    if (s == "query") return procedure_kind::query;
    if (s == "mutation") return procedure_kind::mutation;
    if (s == "subscription") return procedure_kind::subscription;
    throw std::runtime_error("invalid procedure_kind: " + s);
}

struct request_t {
    std::int64_t id = 0;
    procedure_kind method = procedure_kind::query;
    std::string path;
    std::optional<std::string> cursor;
    std::map<std::string, std::string> headers;
};

inline auto fields(const request_t& r) {
    return std::make_tuple(
        field("id", r.id),
        field("method", r.method),
        field("path", r.path),
        field("cursor", r.cursor),
        field("headers", r.headers)
    );
}

inline auto fields(request_t& r) {
    return std::make_tuple(
        field("id", r.id),
        field("method", r.method),
        field("path", r.path),
        field("cursor", r.cursor),
        field("headers", r.headers)
    );
}

struct post_t {
    std::int64_t id = 0;
    std::string title;
    std::optional<std::string> editor;
    bytes_t thumbnail;
};

inline auto fields(const post_t& p) {
    return std::make_tuple(
        field("id", p.id),
        field("title", p.title),
        field("editor", p.editor),
        field("thumbnail", p.thumbnail)
    );
}

inline auto fields(post_t& p) {
    return std::make_tuple(
        field("id", p.id),
        field("title", p.title),
        field("editor", p.editor),
        field("thumbnail", p.thumbnail)
    );
}

struct response_t {
    std::int64_t id = 0;
    std::vector<post_t> data;
    std::optional<std::string> next_cursor;
};

inline auto fields(const response_t& r) {
    return std::make_tuple(
        field("id", r.id),
        field("data", r.data),
        field("next_cursor", r.next_cursor)
    );
}

inline auto fields(response_t& r) {
    return std::make_tuple(
        field("id", r.id),
        field("data", r.data),
        field("next_cursor", r.next_cursor)
    );
}

// =============================================================================
// Program configuration (overridable as key=value arguments)
// =============================================================================

struct link_config_t {
    int requests = 2;
    int page_size = 3;
    bool dump = true;
    encoder_config_t encoder;
};

inline auto fields(link_config_t& c) {
    return std::make_tuple(
        field("requests", c.requests),
        field("page_size", c.page_size),
        field("dump", c.dump),
        field("encoder", c.encoder)
    );
}

// =============================================================================
// In-process link: both ends share one encoder
// =============================================================================

class link_t {
public:
    link_t(const encoder_t& encoder, const link_config_t& config, std::ostream& out)
        : encoder_(encoder)
        , config_(config)
        , out_(out)
        , colors_(color::for_stream(out))
    {
    }

    auto call(const request_t& request) -> response_t {
        auto frame = encoder_.encode(to_value(request));
        trace(colors_.client, "client -> server", frame);

        auto reply = serve(frame);
        trace(colors_.server, "server -> client", reply);

        auto response = response_t{};
        from_value(encoder_.decode(reply), response);
        return response;
    }

    // A peer configured with a text encoder sends a JSON string
    void call_with_text(const std::string& text) {
        try {
            serve(text);
        } catch (const unexpected_text_input& e) {
            out_ << colors_.warning << "server rejected frame: " << colors_.reset << e.what() << "\n";
        }
    }

private:
    const encoder_t& encoder_;
    link_config_t config_;
    std::ostream& out_;
    color::scheme_t colors_;

    auto serve(const frame_t& frame) -> bytes_t {
        auto request = request_t{};
        from_value(encoder_.decode(frame), request);

        auto first = request.cursor ? std::stoll(*request.cursor) : std::int64_t{0};
        auto response = response_t{};
        response.id = request.id;

        for (auto i = first; i < first + config_.page_size; ++i) {
            auto post = post_t{};
            post.id = i;
            post.title = "post " + std::to_string(i) + " from " + request.path;
            if (i % 2 == 1) {
                post.editor = "editor-" + std::to_string(i);
            }
            post.thumbnail = bytes_t(static_cast<std::size_t>(8 + i), static_cast<std::uint8_t>(i));
            response.data.push_back(post);
        }
        response.next_cursor = std::to_string(first + config_.page_size);
        return encoder_.encode(to_value(response));
    }

    void trace(const char* color, const char* label, const bytes_t& frame) {
        auto value = encoder_.decode(frame);
        out_ << color << label << colors_.reset << "  "
             << colors_.size << frame.size() << " bytes" << colors_.reset
             << " (ascii " << to_ascii(value).size() << " bytes)\n";
        if (config_.dump) {
            out_ << colors_.dump;
            write_ascii(out_, value, 2);
            out_ << colors_.reset;
        }
    }
};

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    auto config = link_config_t{};
    auto err_colors = color::for_stream(std::cerr);

    try {
        for (int i = 1; i < argc; ++i) {
            auto arg = std::string(argv[i]);
            auto eq = arg.find('=');
            if (eq == std::string::npos) {
                std::cerr << "Usage: " << argv[0] << " [key=value ...]\n";
                return 1;
            }
            set(config, arg.substr(0, eq), arg.substr(eq + 1));
        }

        auto colors = color::for_stream(std::cout);
        auto encoder = msgpack_encoder_t(config.encoder);
        auto link = link_t(encoder, config, std::cout);

        auto request = request_t{};
        request.id = 1;
        request.path = "post.list";
        request.headers["x-trace"] = "abc123";

        for (int n = 0; n < config.requests; ++n) {
            std::cout << colors.header << "=== request " << request.id << " ===" << colors.reset << "\n";
            auto response = link.call(request);

            for (const auto& post : response.data) {
                std::cout << "  #" << post.id << " " << post.title
                          << (post.editor ? " (edited by " + *post.editor + ")" : std::string())
                          << "\n";
            }
            request.id += 1;
            request.cursor = response.next_cursor;
        }

        std::cout << colors.header << "=== mismatched peer ===" << colors.reset << "\n";
        link.call_with_text("{\"id\":99,\"method\":\"query\",\"path\":\"post.list\"}");

    } catch (const std::exception& e) {
        std::cerr << err_colors.error << "error: " << err_colors.reset << e.what() << "\n";
        return 1;
    }

    return 0;
}
