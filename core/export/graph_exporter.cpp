#include "export/graph_exporter.hpp"
#include "config/serialization.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <sstream>
#include <stdexcept>

namespace clubnet {

namespace {

std::string csvQuote(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

nlohmann::json clubJson(const ClubRecord& club) {
    nlohmann::json j = {
        {"name", club.name},
        {"city", club.city},
        {"league", club.league},
        {"founded_year", club.founded_year},
        {"stadium", club.stadium},
        {"website", club.website},
        {"is_active", club.is_active},
    };
    if (club.hasCoordinates()) {
        j["latitude"] = *club.latitude;
        j["longitude"] = *club.longitude;
    }
    return j;
}

nlohmann::json metadataJson(const GraphMetadata& m) {
    const auto since_epoch = m.generated_at.time_since_epoch();
    return {
        {"total_nodes", m.total_nodes},
        {"total_edges", m.total_edges},
        {"density", m.density},
        {"connected_components", m.connected_components},
        {"average_degree", m.average_degree},
        {"max_degree", m.max_degree},
        {"min_degree", m.min_degree},
        {"generated_at_ms", std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count()},
    };
}

} // namespace

std::string toString(ExportFormat format) {
    switch (format) {
        case ExportFormat::Png:     return "png";
        case ExportFormat::Jpg:     return "jpg";
        case ExportFormat::Svg:     return "svg";
        case ExportFormat::Pdf:     return "pdf";
        case ExportFormat::Json:    return "json";
        case ExportFormat::Csv:     return "csv";
        case ExportFormat::Gexf:    return "gexf";
        case ExportFormat::GraphMl: return "graphml";
    }
    return "json";
}

std::optional<ExportFormat> parseExportFormat(const std::string& text) {
    for (ExportFormat f : {ExportFormat::Png, ExportFormat::Jpg, ExportFormat::Svg, ExportFormat::Pdf,
                           ExportFormat::Json, ExportFormat::Csv, ExportFormat::Gexf,
                           ExportFormat::GraphMl}) {
        if (toString(f) == text) return f;
    }
    return std::nullopt;
}

bool isImageFormat(ExportFormat format) {
    return format == ExportFormat::Png || format == ExportFormat::Jpg ||
           format == ExportFormat::Svg || format == ExportFormat::Pdf;
}

std::string xmlEscape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c;
        }
    }
    return out;
}

std::string exportGraph(const GraphSnapshot& snapshot, const ExportOptions& options) {
    switch (options.format) {
        case ExportFormat::Json:    return exportJson(snapshot, options);
        case ExportFormat::Csv:     return exportCsv(snapshot);
        case ExportFormat::Gexf:    return exportGexf(snapshot);
        case ExportFormat::GraphMl: return exportGraphMl(snapshot);
        case ExportFormat::Png:
        case ExportFormat::Jpg:
        case ExportFormat::Svg:
        case ExportFormat::Pdf:
            break;
    }
    throw std::invalid_argument("Export format " + toString(options.format) +
                                " is not supported by the graph core");
}

// ─── JSON ──────────────────────────────────────────────────────

std::string exportJson(const GraphSnapshot& snapshot, const ExportOptions& options) {
    nlohmann::json nodes = nlohmann::json::array();
    for (const Node& node : snapshot.graph.nodes()) {
        nlohmann::json j = {{"id", node.id}, {"label", node.label}};
        if (options.include_positions && node.position) {
            j["position"] = {{"x", node.position->x}, {"y", node.position->y}};
        }
        if (options.include_data) j["data"] = clubJson(node.club);
        if (options.include_styles) {
            j["size"] = node.size;
            j["color"] = node.color;
            j["shape"] = node.shape;
        }
        nodes.push_back(std::move(j));
    }

    nlohmann::json edges = nlohmann::json::array();
    for (const Edge& edge : snapshot.graph.edges()) {
        nlohmann::json j = {
            {"id", edge.id},
            {"source", edge.source},
            {"target", edge.target},
            {"type", edge.type},
            {"weight", edge.weight},
        };
        if (options.include_data) {
            nlohmann::json meta = {
                {"strength", edge.strength},
                {"is_active", edge.is_active},
                {"label", edge.label},
                {"description", edge.description},
            };
            if (edge.start_date) meta["start_date"] = *edge.start_date;
            if (edge.end_date) meta["end_date"] = *edge.end_date;
            j["metadata"] = std::move(meta);
        }
        edges.push_back(std::move(j));
    }

    nlohmann::json out = {{"nodes", std::move(nodes)}, {"edges", std::move(edges)}};
    if (options.include_data) out["metadata"] = metadataJson(snapshot.metadata);
    return out.dump(2);
}

// ─── CSV ───────────────────────────────────────────────────────

std::string exportCsv(const GraphSnapshot& snapshot) {
    std::ostringstream out;
    out << "NODES\n";
    out << "id,label,league,city,founded_year\n";
    for (const Node& node : snapshot.graph.nodes()) {
        out << node.id << ',' << csvQuote(node.label) << ',' << csvQuote(node.club.league) << ','
            << csvQuote(node.club.city) << ',' << node.club.founded_year << '\n';
    }

    out << "\nEDGES\n";
    out << "id,source,target,type,weight,strength\n";
    for (const Edge& edge : snapshot.graph.edges()) {
        out << csvQuote(edge.id) << ',' << edge.source << ',' << edge.target << ','
            << csvQuote(toString(edge.type)) << ',' << edge.weight << ','
            << csvQuote(toString(edge.strength)) << '\n';
    }
    return out.str();
}

// ─── GEXF ──────────────────────────────────────────────────────

std::string exportGexf(const GraphSnapshot& snapshot) {
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<gexf xmlns=\"http://www.gexf.net/1.2draft\" version=\"1.2\">\n";
    out << "  <graph mode=\"static\" defaultedgetype=\"undirected\">\n";

    out << "    <nodes>\n";
    for (const Node& node : snapshot.graph.nodes()) {
        out << "      <node id=\"" << node.id << "\" label=\"" << xmlEscape(node.label) << "\"/>\n";
    }
    out << "    </nodes>\n";

    out << "    <edges>\n";
    for (const Edge& edge : snapshot.graph.edges()) {
        out << "      <edge id=\"" << xmlEscape(edge.id) << "\" source=\"" << edge.source
            << "\" target=\"" << edge.target << "\" weight=\"" << edge.weight << "\"/>\n";
    }
    out << "    </edges>\n";

    out << "  </graph>\n";
    out << "</gexf>\n";
    return out.str();
}

// ─── GraphML ───────────────────────────────────────────────────

std::string exportGraphMl(const GraphSnapshot& snapshot) {
    std::ostringstream out;
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<graphml xmlns=\"http://graphml.graphdrawing.org/xmlns\">\n";
    out << "  <key id=\"label\" for=\"node\" attr.name=\"label\" attr.type=\"string\"/>\n";
    out << "  <key id=\"weight\" for=\"edge\" attr.name=\"weight\" attr.type=\"double\"/>\n";
    out << "  <graph id=\"ClubNetwork\" edgedefault=\"undirected\">\n";

    for (const Node& node : snapshot.graph.nodes()) {
        out << "    <node id=\"" << node.id << "\">\n";
        out << "      <data key=\"label\">" << xmlEscape(node.label) << "</data>\n";
        out << "    </node>\n";
    }
    for (const Edge& edge : snapshot.graph.edges()) {
        out << "    <edge id=\"" << xmlEscape(edge.id) << "\" source=\"" << edge.source
            << "\" target=\"" << edge.target << "\">\n";
        out << "      <data key=\"weight\">" << edge.weight << "</data>\n";
        out << "    </edge>\n";
    }

    out << "  </graph>\n";
    out << "</graphml>\n";
    return out.str();
}

} // namespace clubnet
