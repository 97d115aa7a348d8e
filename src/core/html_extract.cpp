/**
 * @file html_extract.cpp
 * @brief Form, link, script and reflection extraction using gumbo
 */

#include "html_extract.h"
#include "url_utils.h"
#include <gumbo.h>
#include <algorithm>
#include <memory>
#include <set>

namespace {

struct GumboOutputDeleter {
    void operator()(GumboOutput* out) const { gumbo_destroy_output(&kGumboDefaultOptions, out); }
};
using GumboDocument = std::unique_ptr<GumboOutput, GumboOutputDeleter>;

GumboDocument parse_document(const std::string& html) {
    return GumboDocument(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string attribute(GumboNode* node, const char* name) {
    GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return (attr && attr->value) ? std::string(attr->value) : std::string();
}

bool has_attribute(GumboNode* node, const char* name) {
    return gumbo_get_attribute(&node->v.element.attributes, name) != nullptr;
}

/// Concatenated text of the direct text children of an element.
std::string own_text(GumboNode* node) {
    std::string text;
    GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; i++) {
        auto* child = static_cast<GumboNode*>(children->data[i]);
        if (child && (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_CDATA ||
                      child->type == GUMBO_NODE_WHITESPACE)) {
            text += child->v.text.text;
        }
    }
    return text;
}

/// Iterative DFS over all element nodes below root, calling fn on each.
template <typename Fn>
void for_each_element(GumboNode* root, Fn fn) {
    if (!root) return;
    std::vector<GumboNode*> stack;
    stack.push_back(root);
    while (!stack.empty()) {
        GumboNode* node = stack.back();
        stack.pop_back();
        if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE) continue;
        fn(node);

        // Push children in reverse so document order is preserved
        GumboVector* children = &node->v.element.children;
        for (unsigned int i = children->length; i > 0; i--) {
            auto* child = static_cast<GumboNode*>(children->data[i - 1]);
            if (child) stack.push_back(child);
        }
    }
}

/// Value of a select element: its selected option, otherwise empty.
std::string select_value(GumboNode* select) {
    std::string value;
    for_each_element(select, [&](GumboNode* n) {
        if (n->v.element.tag == GUMBO_TAG_OPTION && has_attribute(n, "selected") && value.empty()) {
            value = has_attribute(n, "value") ? attribute(n, "value") : own_text(n);
        }
    });
    return value;
}

Form read_form(GumboNode* node, const std::string& page_url) {
    Form form;
    std::string action = attribute(node, "action");
    form.action = action.empty() ? page_url : resolve_url(page_url, action);
    if (form.action.empty()) form.action = page_url;
    std::string method = to_lower(attribute(node, "method"));
    form.method = method.empty() ? "get" : method;

    for_each_element(node, [&](GumboNode* n) {
        GumboTag tag = n->v.element.tag;
        if (tag != GUMBO_TAG_INPUT && tag != GUMBO_TAG_TEXTAREA && tag != GUMBO_TAG_SELECT) return;
        // Ignore nameless inputs
        std::string name = attribute(n, "name");
        if (name.empty()) return;

        FormInput input;
        input.name = name;
        if (tag == GUMBO_TAG_TEXTAREA) {
            input.type = "textarea";
            input.value = own_text(n);
        } else if (tag == GUMBO_TAG_SELECT) {
            input.type = "select";
            input.value = select_value(n);
        } else {
            std::string type = to_lower(attribute(n, "type"));
            input.type = type.empty() ? "text" : type;
            input.value = attribute(n, "value");
        }
        form.inputs.push_back(std::move(input));
    });
    return form;
}

void add_link(const std::string& page_url, const std::string& href,
              std::set<std::string>& seen, std::vector<std::string>& out) {
    if (href.empty() || href[0] == '#') return;
    std::string resolved = resolve_url(page_url, href);
    if (resolved.empty() || !is_valid_url(resolved)) return;
    std::string norm = normalize_url(resolved);
    if (!norm.empty() && seen.insert(norm).second) {
        out.push_back(norm);
    }
}

} // namespace

std::vector<Form> extract_forms(const std::string& html, const std::string& page_url) {
    std::vector<Form> forms;
    GumboDocument doc = parse_document(html);
    if (!doc) return forms;

    for_each_element(doc->root, [&](GumboNode* node) {
        if (node->v.element.tag == GUMBO_TAG_FORM) {
            forms.push_back(read_form(node, page_url));
        }
    });
    return forms;
}

std::vector<std::string> extract_links(const std::string& html, const std::string& page_url) {
    std::vector<std::string> links;
    std::set<std::string> seen;
    GumboDocument doc = parse_document(html);
    if (!doc) return links;

    for_each_element(doc->root, [&](GumboNode* node) {
        switch (node->v.element.tag) {
            case GUMBO_TAG_A:
            case GUMBO_TAG_LINK:
                add_link(page_url, attribute(node, "href"), seen, links);
                break;
            case GUMBO_TAG_SCRIPT:
            case GUMBO_TAG_IMG:
                add_link(page_url, attribute(node, "src"), seen, links);
                break;
            default:
                break;
        }
    });
    return links;
}

std::vector<ScriptTag> extract_scripts(const std::string& html, const std::string& page_url) {
    std::vector<ScriptTag> scripts;
    GumboDocument doc = parse_document(html);
    if (!doc) return scripts;

    for_each_element(doc->root, [&](GumboNode* node) {
        if (node->v.element.tag != GUMBO_TAG_SCRIPT) return;
        ScriptTag tag;
        tag.raw_src = attribute(node, "src");
        tag.integrity = attribute(node, "integrity");
        if (!tag.raw_src.empty()) {
            std::string src = tag.raw_src;
            // Protocol-relative sources are fetched over https
            if (src.rfind("//", 0) == 0) src = "https:" + src;
            tag.src = resolve_url(page_url, src);
        }
        scripts.push_back(std::move(tag));
    });
    return scripts;
}

std::vector<std::string> extract_stylesheets(const std::string& html, const std::string& page_url) {
    std::vector<std::string> sheets;
    GumboDocument doc = parse_document(html);
    if (!doc) return sheets;

    for_each_element(doc->root, [&](GumboNode* node) {
        if (node->v.element.tag != GUMBO_TAG_LINK) return;
        if (to_lower(attribute(node, "rel")).find("stylesheet") == std::string::npos) return;
        std::string href = resolve_url(page_url, attribute(node, "href"));
        if (!href.empty()) sheets.push_back(href);
    });
    return sheets;
}

std::vector<std::string> meta_names(const std::string& html) {
    std::vector<std::string> names;
    GumboDocument doc = parse_document(html);
    if (!doc) return names;

    for_each_element(doc->root, [&](GumboNode* node) {
        if (node->v.element.tag == GUMBO_TAG_META) {
            std::string name = to_lower(attribute(node, "name"));
            if (!name.empty()) names.push_back(name);
        }
    });
    return names;
}

size_t count_password_inputs(const std::string& html) {
    size_t count = 0;
    GumboDocument doc = parse_document(html);
    if (!doc) return count;

    for_each_element(doc->root, [&](GumboNode* node) {
        if (node->v.element.tag == GUMBO_TAG_INPUT && to_lower(attribute(node, "type")) == "password") {
            count++;
        }
    });
    return count;
}

std::string strip_inert_elements(const std::string& html) {
    static const std::vector<std::string> tags = {"textarea", "code", "pre"};
    std::string out = html;

    for (const auto& tag : tags) {
        std::string open = "<" + tag;
        std::string close = "</" + tag;
        std::string lower = to_lower(out);
        size_t pos = 0;
        while (true) {
            size_t start = lower.find(open, pos);
            if (start == std::string::npos) break;
            // Require a tag boundary so <code> does not match <codex>
            size_t after = start + open.size();
            if (after < lower.size() && std::isalnum(static_cast<unsigned char>(lower[after]))) {
                pos = after;
                continue;
            }
            size_t end = lower.find(close, after);
            if (end == std::string::npos) {
                out.erase(start);
                break;
            }
            size_t gt = lower.find('>', end);
            size_t stop = (gt == std::string::npos) ? lower.size() : gt + 1;
            out.erase(start, stop - start);
            lower.erase(start, stop - start);
            pos = start;
        }
    }
    return out;
}

std::vector<std::string> reflection_contexts(const std::string& html, const std::string& marker) {
    std::vector<std::string> contexts;
    if (marker.empty() || html.find(marker) == std::string::npos) return contexts;

    GumboDocument doc = parse_document(html);
    if (doc) {
        bool in_script = false;
        std::vector<std::string> attrs;
        for_each_element(doc->root, [&](GumboNode* node) {
            if (node->v.element.tag == GUMBO_TAG_SCRIPT && own_text(node).find(marker) != std::string::npos) {
                in_script = true;
            }
            const GumboVector* attributes = &node->v.element.attributes;
            for (unsigned int i = 0; i < attributes->length; i++) {
                auto* attr = static_cast<GumboAttribute*>(attributes->data[i]);
                if (attr && attr->value && std::string(attr->value).find(marker) != std::string::npos) {
                    attrs.push_back("attribute:" + std::string(attr->name));
                }
            }
        });
        if (in_script) contexts.push_back("script");
        contexts.insert(contexts.end(), attrs.begin(), attrs.end());
    }

    contexts.push_back("html");
    if (html.find("href=\"" + marker + "\"") != std::string::npos ||
        html.find("src=\"" + marker + "\"") != std::string::npos) {
        contexts.push_back("url");
    }
    return contexts;
}
