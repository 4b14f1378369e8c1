#ifndef USER_PROFILE_H
#define USER_PROFILE_H

#include <set>
#include <map>
#include "item.h"

struct UserProfile {
    int user_id = -1;
    std::set<int> liked;
    std::set<int> disliked;
    std::map<int, double> rated;
    bool has_preferences = false;
    StatedPreferences preferences;
};

// false when the user has no like, dislike or rating at all (cold start)
bool build_user_profile(int user_id, const UserActivity& activity, UserProfile& out);

bool profile_has_interaction(const UserProfile& p, int item_id);

#endif
