#pragma once

#include <ostream>
#include <string>

namespace routegraph {

struct RouteGraph;

/// Abstract interface for snapshot exporters
class IExporter {
public:
    virtual ~IExporter() = default;

    /// Export a positioned graph to string
    virtual std::string exportToString(const RouteGraph& graph) = 0;

    /// Export to an output stream
    virtual void exportToStream(const RouteGraph& graph, std::ostream& out) = 0;

    /// Export to a file
    /// @return false if the file could not be opened
    virtual bool exportToFile(const RouteGraph& graph, const std::string& filename) = 0;

    /// File extension for this format (e.g., "svg")
    virtual std::string fileExtension() const = 0;

    /// MIME type for this format (e.g., "image/svg+xml")
    virtual std::string mimeType() const = 0;
};

}  // namespace routegraph
