#pragma once

#include "graph/graph_snapshot.hpp"

#include <optional>
#include <string>

namespace clubnet {

enum class ExportFormat { Png, Jpg, Svg, Pdf, Json, Csv, Gexf, GraphMl };

std::string toString(ExportFormat format);
std::optional<ExportFormat> parseExportFormat(const std::string& text);

/// Image formats are recognized but not produced by the core.
bool isImageFormat(ExportFormat format);

struct ExportOptions {
    ExportFormat format = ExportFormat::Json;
    bool include_data = false;       // club/connection attributes and metadata
    bool include_positions = false;
    bool include_styles = false;     // size, color, shape
};

// ─── Graph Exporter ────────────────────────────────────────────
// Serializes a snapshot. Every format carries the same nodes and
// edges in snapshot order:
//   JSON     nodes/edges arrays, optional data, positions, styles, metadata
//   CSV      a NODES section and an EDGES section
//   GEXF     1.2, static undirected graph with labels and weights
//   GraphML  undirected graph with label and weight keys
// Image formats throw std::invalid_argument.

std::string exportGraph(const GraphSnapshot& snapshot, const ExportOptions& options);

std::string exportJson(const GraphSnapshot& snapshot, const ExportOptions& options);
std::string exportCsv(const GraphSnapshot& snapshot);
std::string exportGexf(const GraphSnapshot& snapshot);
std::string exportGraphMl(const GraphSnapshot& snapshot);

/// Escape &, <, >, " and ' for XML attribute values.
std::string xmlEscape(const std::string& text);

} // namespace clubnet
