#include "readability.hpp"
#include <algorithm>
#include <cctype>
#include <functional>
#include <set>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "../utils/text/string_utils.hpp"

namespace Reader {
namespace Transform {

namespace {

const std::set<std::string> kDroppedTags = {
    "script", "style", "noscript", "iframe", "template", "object", "embed", "canvas", "link", "meta"};

const std::set<std::string> kChromeTags = {"nav", "footer", "header", "aside", "form"};

const std::set<std::string> kChromeRoles = {
    "banner", "navigation", "contentinfo", "complementary", "dialog", "alertdialog"};

// Matched against whole class/id tokens, so "ad" does not hit "header".
const std::set<std::string> kChromeTokens = {
    "ad",       "ads",     "advert",  "advertisement", "banner",     "comment",
    "comments", "cookie",  "cookies", "consent",       "share",      "sharing",
    "social",   "sidebar", "sponsor", "sponsored",     "promo",      "popup",
    "newsletter", "subscribe", "breadcrumb", "breadcrumbs", "related"};

const std::set<std::string> kPositiveTokens = {
    "article", "body", "content", "entry", "main", "page", "post", "story", "text", "blog"};

const std::set<std::string> kNegativeTokens = {
    "footer", "footnote", "masthead", "menu", "meta", "nav", "outbrain", "pager", "shoutbox",
    "widget", "combx", "community", "disqus", "extra", "foot", "header", "legends", "remark",
    "rss", "shopping", "skyscraper", "tweet", "twitter"};

const std::set<std::string> kVoidTags = {"area", "base", "br", "col", "embed", "hr", "img",
                                         "input", "link", "meta", "source", "track", "wbr"};

const std::set<std::string> kParagraphTags = {"p", "pre", "blockquote", "td"};

const GumboVector* children_of(const GumboNode* node) {
    if (!node)
        return nullptr;
    if (node->type == GUMBO_NODE_DOCUMENT)
        return &node->v.document.children;
    if (node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE)
        return &node->v.element.children;
    return nullptr;
}

const GumboNode* child_at(const GumboVector* children, unsigned int i) {
    return static_cast<const GumboNode*>(children->data[i]);
}

bool is_element(const GumboNode* node) {
    return node && (node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE);
}

std::string tag_name(const GumboNode* node) {
    if (!is_element(node))
        return "";
    if (node->v.element.tag != GUMBO_TAG_UNKNOWN) {
        const char* normalized = gumbo_normalized_tagname(node->v.element.tag);
        return normalized ? std::string(normalized) : "";
    }

    GumboStringPiece original = node->v.element.original_tag;
    gumbo_tag_from_original_text(&original);
    std::string name(original.data ? original.data : "", original.length);
    name.erase(std::remove_if(name.begin(), name.end(),
                              [](unsigned char c) { return !std::isalnum(c) && c != '-'; }),
               name.end());
    return Utils::Text::to_lower(name);
}

std::string attribute(const GumboNode* node, const char* name) {
    if (!is_element(node))
        return "";
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return attr && attr->value ? attr->value : "";
}

std::vector<std::string> class_id_tokens(const GumboNode* node) {
    std::vector<std::string> tokens;
    std::string              current;
    for (char c : attribute(node, "class") + " " + attribute(node, "id")) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty())
        tokens.push_back(std::move(current));
    return tokens;
}

bool has_token(const std::vector<std::string>& tokens, const std::set<std::string>& wanted) {
    return std::any_of(tokens.begin(), tokens.end(),
                       [&](const std::string& t) { return wanted.count(t) > 0; });
}

void append_escaped(std::string& out, std::string_view text, bool in_attribute) {
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                if (in_attribute) {
                    out += "&quot;";
                    break;
                }
                out += c;
                break;
            default:
                out += c;
        }
    }
}

void collect_text(const GumboNode* node,
                  std::string&     out,
                  bool             links_only,
                  bool             in_link,
                  bool             strip = false) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
        case GUMBO_NODE_CDATA:
            if ((!links_only || in_link) && node->v.text.text)
                out += node->v.text.text;
            return;
        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE:
        case GUMBO_NODE_DOCUMENT: {
            if (is_element(node) && kDroppedTags.count(tag_name(node)))
                return;
            if (strip && Readability::is_boilerplate(node))
                return;
            bool link = in_link || (is_element(node) && node->v.element.tag == GUMBO_TAG_A);
            const GumboVector* children = children_of(node);
            for (unsigned int i = 0; i < children->length; ++i)
                collect_text(child_at(children, i), out, links_only, link, strip);
            return;
        }
        default:
            return;
    }
}

double link_density(const GumboNode* node) {
    std::string all;
    std::string links;
    collect_text(node, all, false, false);
    collect_text(node, links, true, false);
    size_t total = Utils::Text::trim(all).size();
    if (total == 0)
        return 0.0;
    return static_cast<double>(Utils::Text::trim(links).size()) / static_cast<double>(total);
}

double class_weight(const GumboNode* node) {
    auto   tokens = class_id_tokens(node);
    double weight = 0.0;
    if (has_token(tokens, kPositiveTokens))
        weight += 25.0;
    if (has_token(tokens, kNegativeTokens) || has_token(tokens, kChromeTokens))
        weight -= 25.0;
    return weight;
}

double initial_score(const GumboNode* node) {
    std::string tag   = tag_name(node);
    double      score = class_weight(node);
    if (tag == "article")
        score += 10.0;
    else if (tag == "div")
        score += 5.0;
    else if (tag == "pre" || tag == "td" || tag == "blockquote")
        score += 3.0;
    else if (tag == "ol" || tag == "ul" || tag == "dl" || tag == "dd" || tag == "dt" || tag == "li")
        score -= 3.0;
    else if (tag.size() == 2 && tag[0] == 'h' && std::isdigit(static_cast<unsigned char>(tag[1])))
        score -= 5.0;
    else if (tag == "th")
        score -= 5.0;
    return score;
}

void collect_paragraphs(const GumboNode* node, std::vector<const GumboNode*>& out) {
    const GumboVector* children = children_of(node);
    if (!children)
        return;
    if (is_element(node)) {
        std::string tag = tag_name(node);
        if (kDroppedTags.count(tag) || Readability::is_boilerplate(node))
            return;
        if (kParagraphTags.count(tag))
            out.push_back(node);
    }
    for (unsigned int i = 0; i < children->length; ++i)
        collect_paragraphs(child_at(children, i), out);
}

const GumboNode* find_first(const GumboNode* node, const std::function<bool(const GumboNode*)>& match) {
    if (is_element(node) && match(node))
        return node;
    const GumboVector* children = children_of(node);
    if (!children)
        return nullptr;
    for (unsigned int i = 0; i < children->length; ++i) {
        if (const GumboNode* found = find_first(child_at(children, i), match))
            return found;
    }
    return nullptr;
}

const GumboNode* best_scored_candidate(const GumboNode* root) {
    std::vector<const GumboNode*> paragraphs;
    collect_paragraphs(root, paragraphs);

    std::unordered_map<const GumboNode*, double> scores;
    std::vector<const GumboNode*>                order;
    auto add_score = [&](const GumboNode* node, double amount) {
        if (!is_element(node))
            return;
        auto it = scores.find(node);
        if (it == scores.end()) {
            it = scores.emplace(node, initial_score(node)).first;
            order.push_back(node);
        }
        it->second += amount;
    };

    for (const GumboNode* p : paragraphs) {
        std::string text = Utils::Text::trim(Readability::text_content(p));
        if (text.size() < Readability::kMinParagraphChars)
            continue;

        double score = 1.0 + static_cast<double>(std::count(text.begin(), text.end(), ','));
        score += std::min(static_cast<double>(text.size() / 100), 3.0);

        const GumboNode* parent = p->parent;
        add_score(parent, score);
        if (parent)
            add_score(parent->parent, score / 2.0);
    }

    const GumboNode* best       = nullptr;
    double           best_score = 0.0;
    for (const GumboNode* node : order) {
        double final_score = scores[node] * (1.0 - link_density(node));
        if (final_score > best_score) {
            best       = node;
            best_score = final_score;
        }
    }
    return best;
}

void serialize_node(const GumboNode* node, bool strip, std::string& out) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_WHITESPACE:
        case GUMBO_NODE_CDATA:
            if (node->v.text.text)
                append_escaped(out, node->v.text.text, false);
            return;
        case GUMBO_NODE_DOCUMENT: {
            const GumboVector* children = children_of(node);
            for (unsigned int i = 0; i < children->length; ++i)
                serialize_node(child_at(children, i), strip, out);
            return;
        }
        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE:
            break;
        default:
            return;
    }

    std::string tag = tag_name(node);
    if (kDroppedTags.count(tag) || (strip && Readability::is_boilerplate(node)))
        return;

    const GumboVector* children = children_of(node);
    if (tag.empty()) {
        for (unsigned int i = 0; i < children->length; ++i)
            serialize_node(child_at(children, i), strip, out);
        return;
    }

    out += "<" + tag;
    const GumboVector& attributes = node->v.element.attributes;
    for (unsigned int i = 0; i < attributes.length; ++i) {
        const auto* attr = static_cast<const GumboAttribute*>(attributes.data[i]);
        std::string name = attr->name ? attr->name : "";
        if (name.empty() || name == "style" || Utils::Text::starts_with(name, "on"))
            continue;
        out += " " + name + "=\"";
        append_escaped(out, attr->value ? attr->value : "", true);
        out += "\"";
    }
    out += ">";

    if (kVoidTags.count(tag))
        return;

    for (unsigned int i = 0; i < children->length; ++i)
        serialize_node(child_at(children, i), strip, out);
    out += "</" + tag + ">";
}

}  // namespace

bool Readability::is_boilerplate(const GumboNode* node) {
    if (!is_element(node))
        return false;

    std::string tag = tag_name(node);
    if (tag == "html" || tag == "body" || tag == "article" || tag == "main")
        return false;
    if (kChromeTags.count(tag))
        return true;
    if (kChromeRoles.count(Utils::Text::to_lower(attribute(node, "role"))))
        return true;
    // A content hint ("post-body comments-enabled") outweighs a chrome hint.
    auto tokens = class_id_tokens(node);
    return has_token(tokens, kChromeTokens) && !has_token(tokens, kPositiveTokens);
}

std::string Readability::text_content(const GumboNode* node) {
    std::string out;
    if (node)
        collect_text(node, out, false, false);
    return out;
}

std::string Readability::serialize(const GumboNode* node, bool strip_boilerplate) {
    std::string out;
    if (node)
        serialize_node(node, strip_boilerplate, out);
    return out;
}

std::optional<std::string> Readability::extract(const GumboNode* root) {
    if (!root)
        return std::nullopt;

    std::vector<const GumboNode*> candidates;
    if (const GumboNode* best = best_scored_candidate(root))
        candidates.push_back(best);

    auto by_tag = [](GumboTag tag) {
        return [tag](const GumboNode* n) { return n->v.element.tag == tag; };
    };
    for (const GumboNode* fallback :
         {find_first(root, by_tag(GUMBO_TAG_ARTICLE)),
          find_first(root,
                     [](const GumboNode* n) {
                         return Utils::Text::to_lower(attribute(n, "role")) == "main";
                     }),
          find_first(root, by_tag(GUMBO_TAG_MAIN))}) {
        if (fallback)
            candidates.push_back(fallback);
    }

    for (const GumboNode* candidate : candidates) {
        std::string text;
        collect_text(candidate, text, false, false, true);
        if (!Utils::Text::trim(text).empty())
            return serialize(candidate, true);
    }
    return std::nullopt;
}

}  // namespace Transform
}  // namespace Reader
