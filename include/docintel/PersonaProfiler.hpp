#pragma once

#include <string>
#include <vector>

#include "docintel/Models.hpp"

namespace docintel {

struct ProfileConfig {
    double job_tf_factor = 2.0;       // "what they need" counts double
    double persona_tf_factor = 1.0;
    bool include_phrases = true;      // adjacent-term bigrams as extra terms
};

PersonaProfile build_profile(
    const std::string& persona_text,
    const std::string& job_text,
    const ProfileConfig& cfg = {}
);

// researcher | student | analyst | manager | planner | contractor | professional
std::string identify_persona_type(const std::string& persona_text);

Requirements extract_requirements(const std::string& job_text);

// Profile terms ordered by weight (desc), ties by term.
std::string profile_query_text(const PersonaProfile& profile, size_t max_terms = 32);

// duration and special needs, e.g. "4 days budget-friendly"
std::string requirement_text(const Requirements& r);

// what the encoder sees for the profile: weighted terms, then requirement cues
std::string embedding_query(const PersonaProfile& profile);

}  // namespace docintel
