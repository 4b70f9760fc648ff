#include "docintel/PersonaProfiler.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "text/TextUtil.hpp"

namespace docintel {

static std::vector<std::string> profile_terms(const std::string& text, bool phrases) {
    std::vector<std::string> terms = textutil::content_terms(text);
    if (phrases) {
        std::vector<std::string> ph = textutil::phrase_terms(terms);
        terms.insert(terms.end(), ph.begin(), ph.end());
    }
    return terms;
}

// normalized words without the short-token filter, so "4" and "10" survive
static std::vector<std::string> raw_words(const std::string& text) {
    const std::string norm = textutil::normalize(text);
    std::vector<std::string> out;
    std::string cur;
    for (char c : norm) {
        if (c == ' ') {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

static bool is_number(const std::string& w) {
    if (w.empty()) return false;
    for (char c : w) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string identify_persona_type(const std::string& persona_text) {
    struct TypeKeys {
        const char* type;
        std::vector<std::string> keys;
    };

    // first three keywords of each type identify it, as the type name itself does
    static const std::vector<TypeKeys> table = {
        {"researcher", {"research", "methodology", "analysis"}},
        {"student", {"learn", "study", "exam"}},
        {"analyst", {"analysis", "trend", "metric"}},
        {"manager", {"strategy", "planning", "coordination"}},
        {"planner", {"plan", "schedule", "organize"}},
        {"contractor", {"service", "delivery", "quality"}},
        {"professional", {"expertise", "skill", "experience"}},
    };

    const std::vector<std::string> words = raw_words(persona_text);
    std::vector<std::string> stems;
    stems.reserve(words.size());
    for (const auto& w : words) stems.push_back(textutil::stem(w));

    auto has = [&](const std::string& k) {
        return std::find(stems.begin(), stems.end(), k) != stems.end() ||
               std::find(words.begin(), words.end(), k) != words.end();
    };

    for (const auto& t : table) {
        if (has(t.type)) return t.type;
        for (const auto& k : t.keys) {
            if (has(k)) return t.type;
        }
    }

    if (has("hr") || has("human") || has("resource")) return "professional";
    if (has("food") || has("chef") || has("cook") || has("menu")) return "contractor";
    if (has("travel") || has("trip") || has("tour")) return "planner";

    return "professional";
}

Requirements extract_requirements(const std::string& job_text) {
    static const std::vector<std::string> group_nouns = {
        "people", "person", "friend", "guest", "individual", "member",
        "student", "colleague", "participant", "attendee", "traveler", "traveller"
    };
    static const std::vector<std::string> duration_units = {"day", "week", "hour", "month", "night"};

    static const std::vector<std::pair<std::string, std::string>> needs = {
        {"corporate", "professional"},
        {"buffet", "buffet-style"},
        {"college", "budget-friendly"},
        {"vegetarian", "vegetarian"},
        {"vegan", "vegan"},
        {"halal", "halal"},
        {"kosher", "kosher"},
    };

    Requirements r;
    const std::vector<std::string> words = raw_words(job_text);

    for (size_t i = 0; i < words.size(); ++i) {
        if (!is_number(words[i])) continue;

        // "10 college friends": allow one qualifier between number and noun
        for (size_t j = i + 1; j < words.size() && j <= i + 2 && r.group_size == 0; ++j) {
            const std::string s = textutil::stem(words[j]);
            if (std::find(group_nouns.begin(), group_nouns.end(), s) != group_nouns.end()) {
                try {
                    r.group_size = std::stoi(words[i]);
                } catch (const std::exception&) {
                    r.group_size = 0;
                }
            }
        }

        if (r.duration.empty() && i + 1 < words.size()) {
            const std::string unit = textutil::stem(words[i + 1]);
            if (std::find(duration_units.begin(), duration_units.end(), unit) != duration_units.end()) {
                r.duration = words[i] + " " + unit + "s";
            }
        }
    }

    const std::string norm = " " + textutil::normalize(job_text) + " ";
    for (const auto& kv : needs) {
        if (norm.find(" " + kv.first + " ") == std::string::npos) continue;
        if (std::find(r.special_needs.begin(), r.special_needs.end(), kv.second) == r.special_needs.end()) {
            r.special_needs.push_back(kv.second);
        }
    }
    if (norm.find(" gluten free ") != std::string::npos) r.special_needs.push_back("gluten-free");

    return r;
}

PersonaProfile build_profile(
    const std::string& persona_text,
    const std::string& job_text,
    const ProfileConfig& cfg
) {
    PersonaProfile p;
    p.persona = persona_text;
    p.job = job_text;

    const std::vector<std::string> role_terms = profile_terms(persona_text, cfg.include_phrases);
    const std::vector<std::string> task_terms = profile_terms(job_text, cfg.include_phrases);

    p.role_keywords.insert(role_terms.begin(), role_terms.end());
    p.task_keywords.insert(task_terms.begin(), task_terms.end());

    std::map<std::string, double> raw;
    for (const auto& t : task_terms) raw[t] += cfg.job_tf_factor;
    for (const auto& t : role_terms) raw[t] += cfg.persona_tf_factor;

    double total = 0.0;
    for (const auto& kv : raw) total += kv.second;

    if (total > 0.0) {
        for (const auto& kv : raw) {
            if (kv.second <= 0.0) continue;
            p.weighted_terms[kv.first] = kv.second / total;
        }
    }

    p.persona_type = identify_persona_type(persona_text);
    p.requirements = extract_requirements(job_text);
    return p;
}

std::string profile_query_text(const PersonaProfile& profile, size_t max_terms) {
    std::vector<std::pair<std::string, double>> terms;
    terms.reserve(profile.weighted_terms.size());
    for (const auto& kv : profile.weighted_terms) {
        // phrases repeat their unigrams; keep single terms for the encoder
        if (kv.first.find(' ') != std::string::npos) continue;
        terms.push_back(kv);
    }

    std::sort(terms.begin(), terms.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });

    if (terms.size() > max_terms) terms.resize(max_terms);

    std::string out;
    for (const auto& kv : terms) {
        if (!out.empty()) out.push_back(' ');
        out += kv.first;
    }
    return out;
}

std::string requirement_text(const Requirements& r) {
    std::string out = r.duration;
    for (const auto& need : r.special_needs) {
        if (!out.empty()) out.push_back(' ');
        out += need;
    }
    return out;
}

std::string embedding_query(const PersonaProfile& profile) {
    std::string q = profile_query_text(profile);
    const std::string cues = requirement_text(profile.requirements);
    if (!cues.empty()) {
        if (!q.empty()) q.push_back(' ');
        q += cues;
    }
    return q;
}

}  // namespace docintel
