#pragma once

#include <string>
#include <vector>

namespace banditlab {

using FeatureVector = std::vector<double>;

// One selectable option. Immutable once the environment is built.
struct Article {
    int id;
    std::string title;
    std::string category;
    double true_ctr;                    // ground-truth click probability
    FeatureVector topic_features;       // unit length, kFeatureDimension entries

    Article() : id(0), true_ctr(0.0) {}
};

// A simulated reader drawn per interaction in contextual mode.
struct UserContext {
    int user_id;
    int age;
    std::string location;
    std::vector<std::string> preferred_categories;
    FeatureVector features;             // [age/100, location_index/5, 0.5, 0.5, 0.5]

    UserContext() : user_id(0), age(0) {}
};

struct HistoryEntry {
    int arm;
    double reward;
};

} // namespace banditlab
