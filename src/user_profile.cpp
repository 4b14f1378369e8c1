#include "user_profile.h"
#include <algorithm>
#include <vector>

using namespace std;

static bool by_timestamp(const ActivityRecord& A, const ActivityRecord& B) {
    return A.timestamp < B.timestamp;
}

bool build_user_profile(int user_id, const UserActivity& activity, UserProfile& out) {
    UserProfile p;
    p.user_id = user_id;

    // records are applied oldest first; a later like/dislike overrides an earlier one
    vector<ActivityRecord> likes = activity.like_records;
    stable_sort(likes.begin(), likes.end(), by_timestamp);
    bool any_signal = false;
    for (const ActivityRecord& r : likes) {
        if (r.kind == ActivityKind::Like) {
            p.disliked.erase(r.item_id);
            p.liked.insert(r.item_id);
            any_signal = true;
        } else if (r.kind == ActivityKind::Dislike) {
            p.liked.erase(r.item_id);
            p.disliked.insert(r.item_id);
            any_signal = true;
        }
    }

    vector<ActivityRecord> ratings = activity.rating_records;
    stable_sort(ratings.begin(), ratings.end(), by_timestamp);
    for (const ActivityRecord& r : ratings) {
        if (r.kind != ActivityKind::Rating) continue;
        any_signal = true;
        if (p.liked.count(r.item_id) || p.disliked.count(r.item_id)) continue;
        p.rated[r.item_id] = r.value;
    }

    if (!any_signal) return false;

    p.has_preferences = activity.has_preferences;
    p.preferences = activity.preferences;
    out = std::move(p);
    return true;
}

bool profile_has_interaction(const UserProfile& p, int item_id) {
    return p.liked.count(item_id) > 0 || p.disliked.count(item_id) > 0;
}
