#pragma once

#include <routegraph/core/Route.h>

#include <string>

namespace routegraph::test {

/// root -> {a, b}, a -> {a1}
inline Route sampleTree() {
    return Route("root", "/", "Home", {
        Route("a", "/a", "A", {
            Route("a1", "/a/1", "A1"),
        }),
        Route("b", "/b", "B"),
    });
}

/// Root with `width` children, each with `depth` descendants in a chain
inline Route broomTree(int width, int depth) {
    Route root("root", "/", "Home");
    for (int i = 0; i < width; ++i) {
        std::string id = "c" + std::to_string(i);
        Route child(id, "/" + id);
        Route* tail = &child;
        for (int d = 0; d < depth; ++d) {
            std::string nested = id + "-" + std::to_string(d);
            tail->routes.push_back(Route(nested, tail->path + "/" + std::to_string(d)));
            tail = &tail->routes.back();
        }
        root.routes.push_back(std::move(child));
    }
    return root;
}

/// Mixed fan-out used by the layout property tests
inline Route wideTree() {
    return Route("root", "/", "Home", {
        Route("dash", "/dashboard", "", {
            Route("dash-overview", "/dashboard/overview"),
            Route("dash-reports", "/dashboard/reports", "", {
                Route("dash-reports-id", "/dashboard/reports/:id"),
                Route("dash-reports-new", "/dashboard/reports/new"),
            }),
            Route("dash-alerts", "/dashboard/alerts"),
        }),
        Route("settings", "/settings", "", {
            Route("settings-profile", "/settings/profile"),
            Route("settings-billing", "/settings/billing", "", {
                Route("settings-billing-invoices", "/settings/billing/invoices"),
            }),
        }),
        Route("about", "/about"),
        Route("help", "/help", "", {
            Route("help-faq", "/help/faq"),
        }),
    });
}

}  // namespace routegraph::test
