#include "routegraph/core/Route.h"

namespace routegraph {

const Route* Route::findChild(const std::string& childId) const {
    for (const Route& child : routes) {
        if (child.id == childId) {
            return &child;
        }
    }
    return nullptr;
}

const Route* Route::find(const std::string& routeId) const {
    if (id == routeId) {
        return this;
    }
    for (const Route& child : routes) {
        if (const Route* found = child.find(routeId)) {
            return found;
        }
    }
    return nullptr;
}

size_t Route::subtreeSize() const {
    size_t count = 1;
    for (const Route& child : routes) {
        count += child.subtreeSize();
    }
    return count;
}

RoutePtr makeRouteTree(Route root) {
    return std::make_shared<const Route>(std::move(root));
}

RoutePtr aliasRoute(const RoutePtr& owner, const Route& route) {
    return RoutePtr(owner, &route);
}

}  // namespace routegraph
