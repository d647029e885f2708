/**
 * landmark_snapshot.cpp — Implementation
 */

#include "landmark_snapshot.hpp"

namespace therapy_lens {

const Point2* LandmarkSnapshot::find_point(const std::string& id) const {
    auto it = points.find(id);
    if (it == points.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace therapy_lens
