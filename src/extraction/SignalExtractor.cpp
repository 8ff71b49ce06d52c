#include "SignalExtractor.h"
#include "../../include/Logger.h"
#include "../../include/site_audit/common/UrlUtils.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <sstream>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace site_audit::extraction {

namespace {

using namespace std::string_view_literals;

// Call-to-action wording, Portuguese and English
constexpr std::array kCtaKeywords = {
    "contato"sv, "fale"sv, "agende"sv, "orcamento"sv, "orçamento"sv, "simule"sv, "comprar"sv,
    "saiba mais"sv, "quero"sv, "whatsapp"sv,
    "contact"sv, "get started"sv, "sign up"sv, "buy"sv, "book now"sv, "book a"sv, "quote"sv, "schedule"sv,
    "subscribe"sv, "request"sv, "talk to"sv
};

constexpr std::array kFaqKeywords = {
    "faq"sv, "perguntas frequentes"sv, "duvidas"sv, "dúvidas"sv, "frequently asked"sv
};

constexpr std::array kTestimonialKeywords = {
    "depoimento"sv, "testemunho"sv, "avaliacoes"sv, "avaliações"sv, "clientes dizem"sv,
    "testimonial"sv, "what our customers"sv
};

constexpr std::array kPricingKeywords = {
    "r$"sv, "preco"sv, "preço"sv, "precos"sv, "investimento"sv, "a partir de"sv,
    "pricing"sv, "per month"sv, "plans"sv
};

constexpr std::array kModernImageExtensions = {"webp"sv, "avif"sv, "svg"sv};

constexpr std::array kSkippedInputTypes = {"hidden"sv, "submit"sv, "button"sv, "image"sv, "reset"sv};

struct GumboOutputDeleter {
    void operator()(GumboOutput* output) const {
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t\r\n\f\v");
    return value.substr(start, end - start + 1);
}

// Collapses internal whitespace runs into single spaces
std::string collapseWhitespace(const std::string& value) {
    std::istringstream stream(value);
    std::string word;
    std::string out;
    while (stream >> word) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

const char* attribute(const GumboNode* node, const char* name) {
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return attr ? attr->value : nullptr;
}

std::string attributeOr(const GumboNode* node, const char* name, const std::string& fallback = "") {
    const char* value = attribute(node, name);
    return value ? std::string(value) : fallback;
}

bool hasNonBlankAttribute(const GumboNode* node, const char* name) {
    const char* value = attribute(node, name);
    return value && !trim(value).empty();
}

template <typename Keywords>
bool containsAny(const std::string& haystack, const Keywords& needles) {
    return std::any_of(needles.begin(), needles.end(), [&haystack](std::string_view needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

std::vector<std::string> splitTokens(const std::string& value) {
    std::istringstream stream(toLower(value));
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool hasToken(const std::vector<std::string>& tokens, const std::string& token) {
    return std::find(tokens.begin(), tokens.end(), token) != tokens.end();
}

std::string extensionOf(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    const size_t slash = path.find_last_of('/');
    if (slash != std::string::npos) {
        path = path.substr(slash + 1);
    }
    const size_t dot = path.find_last_of('.');
    return dot == std::string::npos ? "" : toLower(path.substr(dot + 1));
}

bool isElementNode(const GumboNode* node) {
    return node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE;
}

// nav, role=navigation, header, or a container whose class/id names a menu
bool isNavigationContainer(const GumboNode* node) {
    const GumboTag tag = node->v.element.tag;
    if (tag == GUMBO_TAG_NAV || tag == GUMBO_TAG_HEADER) {
        return true;
    }
    if (toLower(attributeOr(node, "role")) == "navigation") {
        return true;
    }
    if (tag != GUMBO_TAG_DIV && tag != GUMBO_TAG_SECTION && tag != GUMBO_TAG_UL) {
        return false;
    }
    const std::string key = toLower(attributeOr(node, "class") + " " + attributeOr(node, "id"));
    return key.find("nav") != std::string::npos || key.find("menu") != std::string::npos;
}

} // namespace

struct SignalExtractor::WalkState {
    std::string pageUrl;
    std::string pageOrigin;
    bool pageIsHttps = false;

    PageSignals signals;
    std::string text;
    int suppressText = 0;

    std::unordered_set<std::string> seenLinks;
    std::unordered_set<std::string> navLabels;
    std::unordered_set<std::string> ctaTexts;
    std::unordered_set<std::string> labelTargets;
    std::vector<std::pair<std::string, bool>> inputs;   // (id, labelled by itself or an ancestor)
    bool rawLinkMentionsWhatsapp = false;

    void addResource(const std::string& rawUrl) {
        const std::string resolved = common::resolveUrl(pageUrl, trim(rawUrl));
        if (resolved.empty()) {
            return;
        }
        ++signals.resourceCount;
        if (pageIsHttps && resolved.rfind("http://", 0) == 0) {
            ++signals.mixedContentCount;
        }
    }
};

PageSignals SignalExtractor::extract(const std::string& html, const std::string& pageUrl) const {
    WalkState state;
    state.pageUrl = pageUrl;
    state.pageOrigin = common::originOf(pageUrl);
    state.pageIsHttps = pageUrl.rfind("https://", 0) == 0;
    state.signals.pageUrl = pageUrl;
    state.signals.htmlBytes = html.size();

    std::unique_ptr<GumboOutput, GumboOutputDeleter> output(
        gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
    if (!output || !output->root) {
        LOG_WARNING("SignalExtractor: parser produced no document for " + pageUrl);
        return state.signals;
    }

    walk(output->root, state, false, false, false);

    PageSignals signals = std::move(state.signals);
    finish(state, signals);

    LOG_DEBUG("Extracted signals for " + pageUrl +
              ": words=" + std::to_string(signals.wordCount) +
              " links=" + std::to_string(signals.links.size()) +
              " images=" + std::to_string(signals.imagesTotal) +
              " resources=" + std::to_string(signals.resourceCount));
    return signals;
}

void SignalExtractor::walk(const GumboNode* node, WalkState& state, bool inHead, bool inNav, bool inLabel) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_CDATA:
        case GUMBO_NODE_WHITESPACE:
            if (state.suppressText == 0) {
                state.text += node->v.text.text;
                state.text += ' ';
            }
            return;
        case GUMBO_NODE_ELEMENT:
        case GUMBO_NODE_TEMPLATE:
            visitElement(node, state, inHead, inNav, inLabel);
            return;
        default:
            return;
    }
}

void SignalExtractor::visitElement(const GumboNode* node, WalkState& state, bool inHead, bool inNav, bool inLabel) {
    PageSignals& signals = state.signals;
    const GumboTag tag = node->v.element.tag;
    const bool htmlNamespace = node->v.element.tag_namespace == GUMBO_NAMESPACE_HTML;

    if (attribute(node, "itemscope")) {
        signals.hasStructuredData = true;
    }

    switch (tag) {
        case GUMBO_TAG_HTML: {
            const std::string lang = trim(attributeOr(node, "lang"));
            if (!lang.empty()) signals.lang = lang;
            break;
        }
        case GUMBO_TAG_TITLE:
            if (htmlNamespace && !signals.title) {
                std::string title;
                collectText(node, title);
                title = collapseWhitespace(title);
                if (!title.empty()) signals.title = title;
            }
            // Title text is not body copy
            return;
        case GUMBO_TAG_META: {
            const std::string name = toLower(trim(attributeOr(node, "name")));
            const std::string property = toLower(trim(attributeOr(node, "property")));
            const std::string content = trim(attributeOr(node, "content"));
            if (name == "description" && !content.empty() && !signals.metaDescription) {
                signals.metaDescription = content;
            } else if (name == "robots" && !content.empty()) {
                signals.metaRobots = toLower(content);
                signals.noindex = signals.metaRobots->find("noindex") != std::string::npos ||
                                  signals.metaRobots->find("none") != std::string::npos;
            } else if (name == "viewport") {
                signals.hasViewport = true;
            }
            if (property.rfind("og:", 0) == 0) {
                signals.hasOpenGraph = true;
            }
            break;
        }
        case GUMBO_TAG_LINK: {
            const auto rel = splitTokens(attributeOr(node, "rel"));
            const char* href = attribute(node, "href");
            if (!href) break;
            if (hasToken(rel, "canonical") && !signals.canonical) {
                const std::string resolved = common::resolveUrl(state.pageUrl, trim(href));
                if (!resolved.empty()) signals.canonical = resolved;
            }
            const bool stylesheet = hasToken(rel, "stylesheet");
            if (stylesheet || hasToken(rel, "icon") || hasToken(rel, "preload") ||
                hasToken(rel, "modulepreload") || hasToken(rel, "manifest")) {
                state.addResource(href);
            }
            if (stylesheet && inHead && toLower(attributeOr(node, "media")) != "print") {
                ++signals.renderBlockingCount;
            }
            break;
        }
        case GUMBO_TAG_SCRIPT: {
            const std::string type = toLower(trim(attributeOr(node, "type")));
            const char* src = attribute(node, "src");
            if (src) {
                state.addResource(src);
                if (inHead && !attribute(node, "async") && !attribute(node, "defer") && type != "module") {
                    ++signals.renderBlockingCount;
                }
            } else if (type == "application/ld+json") {
                signals.hasStructuredData = true;
            } else if (type.empty() || type == "module" || type.find("javascript") != std::string::npos) {
                ++signals.inlineScriptCount;
                std::string body;
                for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
                    const auto* child = static_cast<const GumboNode*>(node->v.element.children.data[i]);
                    if (child->type == GUMBO_NODE_TEXT || child->type == GUMBO_NODE_WHITESPACE) {
                        body += child->v.text.text;
                    }
                }
                signals.inlineScriptBytes += body.size();
            }
            // Script bodies never count as page text
            return;
        }
        case GUMBO_TAG_STYLE:
            return;
        case GUMBO_TAG_H1: ++signals.h1Count; break;
        case GUMBO_TAG_H2: ++signals.h2Count; break;
        case GUMBO_TAG_H3: ++signals.h3Count; break;
        case GUMBO_TAG_SECTION: ++signals.sectionCount; break;
        case GUMBO_TAG_FORM: ++signals.formCount; break;
        case GUMBO_TAG_IMG: {
            ++signals.imagesTotal;
            if (!hasNonBlankAttribute(node, "alt")) {
                ++signals.imagesMissingAlt;
            }
            const std::string src = trim(attributeOr(node, "src"));
            const std::string dataSrc = trim(attributeOr(node, "data-src"));
            const bool lazyClass = hasToken(splitTokens(attributeOr(node, "class")), "lazy") ||
                                   hasToken(splitTokens(attributeOr(node, "class")), "lazyload");
            if (toLower(attributeOr(node, "loading")) == "lazy" || !dataSrc.empty() || lazyClass) {
                ++signals.imagesLazy;
            }
            const std::string imageUrl = !src.empty() ? src : dataSrc;
            if (!imageUrl.empty()) {
                state.addResource(imageUrl);
                const std::string ext = extensionOf(imageUrl);
                if (std::find(kModernImageExtensions.begin(), kModernImageExtensions.end(), ext) !=
                    kModernImageExtensions.end()) {
                    ++signals.imagesModernFormat;
                }
            }
            break;
        }
        case GUMBO_TAG_IFRAME:
        case GUMBO_TAG_SOURCE:
        case GUMBO_TAG_VIDEO:
        case GUMBO_TAG_AUDIO:
        case GUMBO_TAG_EMBED: {
            const std::string src = trim(attributeOr(node, "src", attributeOr(node, "data-src")));
            if (!src.empty()) state.addResource(src);
            break;
        }
        case GUMBO_TAG_LABEL: {
            const std::string target = trim(attributeOr(node, "for"));
            if (!target.empty()) state.labelTargets.insert(target);
            break;
        }
        case GUMBO_TAG_INPUT:
        case GUMBO_TAG_SELECT:
        case GUMBO_TAG_TEXTAREA: {
            const std::string type = toLower(trim(attributeOr(node, "type")));
            if (tag == GUMBO_TAG_INPUT && (type == "submit" || type == "button")) {
                const std::string value = collapseWhitespace(attributeOr(node, "value", attributeOr(node, "aria-label")));
                if (!value.empty() && containsAny(toLower(value), kCtaKeywords)) {
                    state.ctaTexts.insert(toLower(value));
                }
            }
            if (tag == GUMBO_TAG_INPUT &&
                std::find(kSkippedInputTypes.begin(), kSkippedInputTypes.end(), type) != kSkippedInputTypes.end()) {
                break;
            }
            ++signals.inputsTotal;
            const bool selfLabelled = inLabel ||
                                      hasNonBlankAttribute(node, "aria-label") ||
                                      hasNonBlankAttribute(node, "aria-labelledby");
            state.inputs.emplace_back(trim(attributeOr(node, "id")), selfLabelled);
            break;
        }
        case GUMBO_TAG_A: {
            const char* href = attribute(node, "href");
            std::string label;
            collectText(node, label);
            label = collapseWhitespace(label);

            if (href) {
                const std::string lowerHref = toLower(href);
                if (lowerHref.find("whatsapp") != std::string::npos || lowerHref.find("wa.me") != std::string::npos) {
                    state.rawLinkMentionsWhatsapp = true;
                }
                const std::string resolved = common::resolveUrl(state.pageUrl, trim(href));
                if (!resolved.empty() && state.seenLinks.insert(resolved).second) {
                    signals.links.push_back(resolved);
                    if (common::originOf(resolved) == state.pageOrigin) {
                        ++signals.internalLinkCount;
                    } else {
                        ++signals.externalLinkCount;
                    }
                }
            }
            if (inNav && label.size() >= 2 && label.size() <= 40) {
                state.navLabels.insert(label);
            }
            if (!label.empty() && containsAny(toLower(label), kCtaKeywords)) {
                state.ctaTexts.insert(toLower(label));
            }
            break;
        }
        case GUMBO_TAG_BUTTON: {
            std::string label;
            collectText(node, label);
            label = toLower(collapseWhitespace(label));
            if (label.empty()) label = toLower(trim(attributeOr(node, "aria-label")));
            if (!label.empty() && containsAny(label, kCtaKeywords)) {
                state.ctaTexts.insert(label);
            }
            break;
        }
        default:
            break;
    }

    const bool childInHead = inHead || tag == GUMBO_TAG_HEAD;
    const bool childInNav = inNav || isNavigationContainer(node);
    const bool childInLabel = inLabel || tag == GUMBO_TAG_LABEL;
    const bool silent = tag == GUMBO_TAG_NOSCRIPT || tag == GUMBO_TAG_TEMPLATE;

    if (silent) ++state.suppressText;
    for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
        walk(static_cast<const GumboNode*>(node->v.element.children.data[i]),
             state, childInHead, childInNav, childInLabel);
    }
    if (silent) --state.suppressText;
}

void SignalExtractor::collectText(const GumboNode* node, std::string& text) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_CDATA || node->type == GUMBO_NODE_WHITESPACE) {
        text += node->v.text.text;
        text += ' ';
        return;
    }
    if (!isElementNode(node)) {
        return;
    }
    const GumboTag tag = node->v.element.tag;
    if (tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE) {
        return;
    }
    for (unsigned int i = 0; i < node->v.element.children.length; ++i) {
        collectText(static_cast<const GumboNode*>(node->v.element.children.data[i]), text);
    }
}

void SignalExtractor::finish(WalkState& state, PageSignals& signals) {
    std::istringstream words(state.text);
    std::string word;
    size_t wordCount = 0;
    while (words >> word) {
        ++wordCount;
    }
    signals.wordCount = wordCount;

    const std::string lowerText = toLower(state.text);
    signals.hasFaq = containsAny(lowerText, kFaqKeywords);
    signals.hasTestimonials = containsAny(lowerText, kTestimonialKeywords);
    signals.hasPricing = containsAny(lowerText, kPricingKeywords);
    signals.hasWhatsapp = state.rawLinkMentionsWhatsapp ||
                          lowerText.find("whatsapp") != std::string::npos ||
                          lowerText.find("wa.me") != std::string::npos;

    signals.navItemCount = static_cast<int>(state.navLabels.size());
    signals.ctaCount = static_cast<int>(state.ctaTexts.size());

    int missingLabel = 0;
    for (const auto& [id, labelled] : state.inputs) {
        if (!labelled && (id.empty() || state.labelTargets.count(id) == 0)) {
            ++missingLabel;
        }
    }
    signals.inputsMissingLabel = missingLabel;
}

} // namespace site_audit::extraction
