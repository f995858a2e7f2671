#pragma once

#include <memory>
#include <string>
#include <vector>

namespace routegraph {

/// One node of the route tree produced by a route source.
///
/// `routes` is the insertion-ordered child mapping: each child is keyed by its
/// own `id`, and the sequence order is the order the route source declared them.
/// The tree is immutable once handed to the library.
struct Route {
    std::string id;
    std::string path;
    std::string name;
    std::vector<Route> routes;

    Route() = default;
    Route(std::string id_, std::string path_, std::string name_ = {},
          std::vector<Route> routes_ = {})
        : id(std::move(id_))
        , path(std::move(path_))
        , name(std::move(name_))
        , routes(std::move(routes_)) {}

    bool isLeaf() const { return routes.empty(); }

    /// Child with the given key, or nullptr
    const Route* findChild(const std::string& childId) const;

    /// Depth-first search of the whole subtree (including this route)
    const Route* find(const std::string& routeId) const;

    /// Number of routes in the subtree, including this one
    size_t subtreeSize() const;
};

/// Shared handle to an immutable route (sub)tree.
///
/// A handle to a subtree aliases the root that owns it, so it stays valid for
/// as long as it is held even after the original tree is replaced.
using RoutePtr = std::shared_ptr<const Route>;

/// Wrap a freshly built tree
RoutePtr makeRouteTree(Route root);

/// Handle to `route` (which must live inside `*owner`) sharing owner's lifetime
RoutePtr aliasRoute(const RoutePtr& owner, const Route& route);

}  // namespace routegraph
