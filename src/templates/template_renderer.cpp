#include "templates/template_renderer.hpp"

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>
#include "core/text/trim.hpp"

namespace conductor::templates {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using core::text::trim;
using nlohmann::json;

namespace {

enum class NodeKind { Text, Value, Json, Each, If, Unless };

struct Node {
    NodeKind kind = NodeKind::Text;
    std::string text;  // literal text, or the path argument
    std::vector<Node> body;
    std::vector<Node> else_body;
};

AgentError template_error(const std::string& message, const std::string& code) {
    return AgentError{ErrorCategory::Template, message, code};
}

class Parser {
public:
    explicit Parser(const std::string& source) : src_(source) {}

    std::optional<AgentError> parse(std::vector<Node>& nodes) {
        std::vector<Node> unused;
        return parse_until("", nodes, unused);
    }

private:
    // A tag is standalone when only spaces or tabs share its line.
    bool standalone(std::size_t open, std::size_t after, std::size_t& line_start,
                    std::size_t& next_line) const {
        std::size_t i = open;
        while (i > 0 && (src_[i - 1] == ' ' || src_[i - 1] == '\t')) {
            --i;
        }
        if (i > 0 && src_[i - 1] != '\n') {
            return false;
        }
        std::size_t j = after;
        while (j < src_.size() && (src_[j] == ' ' || src_[j] == '\t' || src_[j] == '\r')) {
            ++j;
        }
        if (j < src_.size() && src_[j] != '\n') {
            return false;
        }
        line_start = i;
        next_line = j < src_.size() ? j + 1 : j;
        return true;
    }

    void strip_standalone(std::vector<Node>& target, std::size_t open,
                          std::size_t after) {
        std::size_t line_start = 0;
        std::size_t next_line = 0;
        if (!standalone(open, after, line_start, next_line)) {
            pos_ = after;
            return;
        }
        const std::size_t indent = open - line_start;
        if (indent > 0 && !target.empty() && target.back().kind == NodeKind::Text) {
            auto& text = target.back().text;
            text.erase(text.size() - std::min(indent, text.size()));
        }
        pos_ = next_line;
    }

    std::optional<AgentError> parse_until(const std::string& block,
                                          std::vector<Node>& body,
                                          std::vector<Node>& else_body) {
        std::vector<Node>* target = &body;
        bool in_else = false;

        while (true) {
            const auto open = src_.find("{{", pos_);
            if (open == std::string::npos) {
                if (pos_ < src_.size()) {
                    target->push_back(Node{NodeKind::Text, src_.substr(pos_), {}, {}});
                }
                pos_ = src_.size();
                if (!block.empty()) {
                    return template_error("Unclosed block: {{#" + block + "}}",
                                          "template_unclosed_block");
                }
                return std::nullopt;
            }
            if (open > pos_) {
                target->push_back(Node{NodeKind::Text, src_.substr(pos_, open - pos_), {}, {}});
            }

            const auto close = src_.find("}}", open + 2);
            if (close == std::string::npos) {
                return template_error("Unterminated tag at offset " + std::to_string(open),
                                      "template_unterminated_tag");
            }
            const std::string tag = trim(src_.substr(open + 2, close - open - 2));
            const std::size_t after = close + 2;

            if (tag.empty()) {
                return template_error("Empty tag at offset " + std::to_string(open),
                                      "template_empty_tag");
            }

            if (tag[0] == '!') {
                strip_standalone(*target, open, after);
                continue;
            }

            if (tag[0] == '#') {
                const auto space = tag.find(' ');
                const std::string keyword = tag.substr(1, space == std::string::npos ? std::string::npos : space - 1);
                const std::string arg = space == std::string::npos ? "" : trim(tag.substr(space + 1));
                Node node;
                if (keyword == "each") {
                    node.kind = NodeKind::Each;
                } else if (keyword == "if") {
                    node.kind = NodeKind::If;
                } else if (keyword == "unless") {
                    node.kind = NodeKind::Unless;
                } else {
                    return template_error("Unknown block helper: " + keyword,
                                          "template_unknown_helper");
                }
                if (arg.empty()) {
                    return template_error("Block helper needs an argument: " + keyword,
                                          "template_missing_argument");
                }
                node.text = arg;
                strip_standalone(*target, open, after);
                if (auto err = parse_until(keyword, node.body, node.else_body)) {
                    return err;
                }
                target->push_back(std::move(node));
                continue;
            }

            if (tag[0] == '/') {
                const std::string name = trim(tag.substr(1));
                if (name != block) {
                    return template_error("Mismatched closing tag {{/" + name + "}}" +
                                              (block.empty() ? "" : " for {{#" + block + "}}"),
                                          "template_mismatched_block");
                }
                strip_standalone(*target, open, after);
                return std::nullopt;
            }

            if (tag == "else") {
                if (block.empty() || in_else) {
                    return template_error("Unexpected {{else}}", "template_unexpected_else");
                }
                strip_standalone(*target, open, after);
                in_else = true;
                target = &else_body;
                continue;
            }

            if (tag.rfind("json ", 0) == 0) {
                target->push_back(Node{NodeKind::Json, trim(tag.substr(5)), {}, {}});
            } else {
                target->push_back(Node{NodeKind::Value, tag, {}, {}});
            }
            pos_ = after;
        }
    }

    const std::string& src_;
    std::size_t pos_ = 0;
};

struct Frame {
    json value;
    std::string key;
    std::size_t index = 0;
    std::size_t count = 0;
    bool iterating = false;
};

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (const char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                parts.push_back(current);
            }
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

std::optional<json> walk(const json& start, const std::vector<std::string>& parts) {
    const json* cursor = &start;
    for (const auto& part : parts) {
        if (cursor->is_object()) {
            auto it = cursor->find(part);
            if (it == cursor->end()) {
                return std::nullopt;
            }
            cursor = &(*it);
        } else if (cursor->is_array()) {
            std::size_t idx = 0;
            try {
                idx = static_cast<std::size_t>(std::stoul(part));
            } catch (const std::exception&) {
                return std::nullopt;
            }
            if (idx >= cursor->size()) {
                return std::nullopt;
            }
            cursor = &(*cursor)[idx];
        } else {
            return std::nullopt;
        }
    }
    return *cursor;
}

// Looks `path` up in the innermost frame, falling back to the root context.
std::optional<json> resolve(const std::string& path, const std::vector<Frame>& frames) {
    const Frame& current = frames.back();
    if (path == "this" || path == ".") {
        return current.value;
    }
    if (path == "@index") {
        return current.iterating ? std::optional<json>(current.index) : std::nullopt;
    }
    if (path == "@key") {
        return current.iterating ? std::optional<json>(current.key) : std::nullopt;
    }
    if (path == "@first") {
        return current.iterating ? std::optional<json>(current.index == 0) : std::nullopt;
    }
    if (path == "@last") {
        return current.iterating ? std::optional<json>(current.index + 1 == current.count)
                                 : std::nullopt;
    }
    if (path.rfind("this.", 0) == 0) {
        return walk(current.value, split_path(path.substr(5)));
    }
    if (path.rfind("@root.", 0) == 0) {
        return walk(frames.front().value, split_path(path.substr(6)));
    }
    if (path.rfind("../", 0) == 0) {
        std::size_t depth = 0;
        std::string rest = path;
        while (rest.rfind("../", 0) == 0) {
            ++depth;
            rest = rest.substr(3);
        }
        if (depth >= frames.size()) {
            return std::nullopt;
        }
        const Frame& target = frames[frames.size() - 1 - depth];
        return rest.empty() ? std::optional<json>(target.value) : walk(target.value, split_path(rest));
    }

    const auto parts = split_path(path);
    if (auto found = walk(current.value, parts)) {
        return found;
    }
    if (frames.size() > 1) {
        return walk(frames.front().value, parts);
    }
    return std::nullopt;
}

bool truthy(const std::optional<json>& value) {
    if (!value.has_value() || value->is_null()) {
        return false;
    }
    if (value->is_boolean()) {
        return value->get<bool>();
    }
    if (value->is_number()) {
        return value->get<double>() != 0.0;
    }
    if (value->is_string() || value->is_array()) {
        return !value->empty();
    }
    return true;
}

std::string format_value(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

std::optional<AgentError> evaluate(const std::vector<Node>& nodes,
                                   std::vector<Frame>& frames, std::string& out);

std::optional<AgentError> evaluate_each(const Node& node, std::vector<Frame>& frames,
                                        std::string& out) {
    const auto collection = resolve(node.text, frames);
    if (!collection.has_value() || collection->is_null() ||
        (collection->is_boolean() && !collection->get<bool>())) {
        return evaluate(node.else_body, frames, out);
    }
    if (!collection->is_array() && !collection->is_object()) {
        return template_error("{{#each " + node.text + "}} needs an array or object",
                              "template_not_iterable");
    }
    if (collection->empty()) {
        return evaluate(node.else_body, frames, out);
    }

    std::size_t index = 0;
    const std::size_t count = collection->size();
    for (auto it = collection->begin(); it != collection->end(); ++it, ++index) {
        Frame frame;
        frame.value = it.value();
        frame.key = collection->is_object() ? it.key() : std::to_string(index);
        frame.index = index;
        frame.count = count;
        frame.iterating = true;
        frames.push_back(std::move(frame));
        auto err = evaluate(node.body, frames, out);
        frames.pop_back();
        if (err) {
            return err;
        }
    }
    return std::nullopt;
}

std::optional<AgentError> evaluate(const std::vector<Node>& nodes,
                                   std::vector<Frame>& frames, std::string& out) {
    for (const auto& node : nodes) {
        switch (node.kind) {
            case NodeKind::Text:
                out += node.text;
                break;
            case NodeKind::Value: {
                const auto value = resolve(node.text, frames);
                if (value.has_value()) {
                    out += format_value(*value);
                }
                break;
            }
            case NodeKind::Json: {
                const auto value = resolve(node.text, frames);
                out += value.has_value() ? value->dump() : "null";
                break;
            }
            case NodeKind::Each:
                if (auto err = evaluate_each(node, frames, out)) {
                    return err;
                }
                break;
            case NodeKind::If:
            case NodeKind::Unless: {
                bool condition = truthy(resolve(node.text, frames));
                if (node.kind == NodeKind::Unless) {
                    condition = !condition;
                }
                if (auto err = evaluate(condition ? node.body : node.else_body, frames, out)) {
                    return err;
                }
                break;
            }
        }
    }
    return std::nullopt;
}

}  // namespace

FileTemplateRenderer::FileTemplateRenderer(std::filesystem::path root)
    : root_(std::move(root)) {}

core::errors::Result<std::string> FileTemplateRenderer::render(
    const std::string& source, const json& context) const {
    std::vector<Node> nodes;
    Parser parser(source);
    if (auto err = parser.parse(nodes)) {
        return *err;
    }

    std::vector<Frame> frames;
    Frame root_frame;
    root_frame.value = context;
    frames.push_back(std::move(root_frame));

    std::string out;
    if (auto err = evaluate(nodes, frames, out)) {
        return *err;
    }
    return out;
}

core::errors::Result<std::filesystem::path> FileTemplateRenderer::resolve_template(
    const std::filesystem::path& relative_path) const {
    if (relative_path.empty() || relative_path.is_absolute()) {
        return AgentError{ErrorCategory::Template,
                          "Template path must be relative: " + relative_path.string(),
                          "template_invalid_path"};
    }

    std::error_code ec;
    const auto canonical_root = std::filesystem::weakly_canonical(root_, ec);
    if (ec) {
        return AgentError{ErrorCategory::Template,
                          "Unable to resolve template root: " + root_.string(),
                          "template_root_invalid"};
    }
    const auto candidate =
        std::filesystem::weakly_canonical(canonical_root / relative_path, ec);
    if (ec) {
        return AgentError{ErrorCategory::Template,
                          "Unable to resolve template: " + relative_path.string(),
                          "template_invalid_path"};
    }

    auto root_it = canonical_root.begin();
    auto cand_it = candidate.begin();
    for (; root_it != canonical_root.end(); ++root_it, ++cand_it) {
        if (cand_it == candidate.end() || *root_it != *cand_it) {
            return AgentError{ErrorCategory::Template,
                              "Template path escapes the template root: " +
                                  relative_path.string(),
                              "template_outside_root"};
        }
    }

    if (!std::filesystem::is_regular_file(candidate, ec) || ec) {
        return AgentError{ErrorCategory::Template,
                          "Template not found: " + candidate.string(),
                          "template_not_found",
                          "Check CONDUCTOR_TEMPLATE_ROOT."};
    }
    return candidate;
}

core::errors::Result<std::string> FileTemplateRenderer::render_file(
    const std::filesystem::path& relative_path, const json& context) const {
    auto resolved = resolve_template(relative_path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto& path = core::errors::get_value(resolved);

    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Template,
                          "Failed to open template: " + path.string(),
                          "template_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto rendered = render(buffer.str(), context);
    if (core::errors::is_error(rendered)) {
        auto err = core::errors::get_error(rendered);
        err.message = relative_path.string() + ": " + err.message;
        return err;
    }
    return rendered;
}

}  // namespace conductor::templates
