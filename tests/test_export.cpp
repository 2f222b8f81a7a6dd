#include <gtest/gtest.h>
#include "export/graph_exporter.hpp"

#include <nlohmann/json.hpp>

using namespace clubnet;

namespace {

GraphSnapshot sample() {
    ClubRecord legia;
    legia.id = 1;
    legia.name = "Legia";
    legia.league = "Ekstraklasa";
    legia.city = "Warszawa";
    legia.founded_year = 1916;
    legia.latitude = 52.25;
    legia.longitude = 21.0;

    ClubRecord polonia;
    polonia.id = 2;
    polonia.name = "Polonia \"Czarne Koszule\"";
    polonia.league = "I Liga";
    polonia.city = "Warszawa";
    polonia.founded_year = 1911;

    Graph g;
    Node n1(legia);
    n1.position = Point{21000.0, 52250.0};
    n1.color = "#e53e3e";
    g.addNode(n1);
    g.addNode(Node(polonia));

    Edge derby("connection-3", 1, 2, ConnectionType::Rivalry, 95.0);
    derby.strength = ConnectionStrength::Strong;
    derby.start_date = "1921-01-01";
    g.addEdge(derby);
    return GraphSnapshot::fromGraph(std::move(g));
}

} // namespace

// ─── Formats ───────────────────────────────────────────────────

TEST(ExportTest, FormatNames) {
    EXPECT_EQ(parseExportFormat("graphml"), ExportFormat::GraphMl);
    EXPECT_EQ(parseExportFormat("png"), ExportFormat::Png);
    EXPECT_FALSE(parseExportFormat("xlsx").has_value());
    EXPECT_TRUE(isImageFormat(ExportFormat::Svg));
    EXPECT_FALSE(isImageFormat(ExportFormat::Csv));
}

TEST(ExportTest, ImageFormatsRejected) {
    for (ExportFormat f : {ExportFormat::Png, ExportFormat::Jpg, ExportFormat::Svg, ExportFormat::Pdf}) {
        ExportOptions options;
        options.format = f;
        EXPECT_THROW(exportGraph(sample(), options), std::invalid_argument) << toString(f);
    }
}

// ─── JSON ──────────────────────────────────────────────────────

TEST(ExportTest, JsonMinimal) {
    auto j = nlohmann::json::parse(exportJson(sample(), ExportOptions{}));
    ASSERT_EQ(j["nodes"].size(), 2u);
    EXPECT_EQ(j["nodes"][0]["id"], 1);
    EXPECT_EQ(j["nodes"][0]["label"], "Legia");
    EXPECT_FALSE(j["nodes"][0].contains("position"));
    EXPECT_FALSE(j["nodes"][0].contains("data"));
    EXPECT_FALSE(j.contains("metadata"));

    ASSERT_EQ(j["edges"].size(), 1u);
    EXPECT_EQ(j["edges"][0]["id"], "connection-3");
    EXPECT_EQ(j["edges"][0]["type"], "rivalry");
    EXPECT_DOUBLE_EQ(j["edges"][0]["weight"].get<double>(), 95.0);
    EXPECT_FALSE(j["edges"][0].contains("metadata"));
}

TEST(ExportTest, JsonWithEverything) {
    ExportOptions options;
    options.include_data = true;
    options.include_positions = true;
    options.include_styles = true;
    auto j = nlohmann::json::parse(exportGraph(sample(), options));

    auto& legia = j["nodes"][0];
    EXPECT_DOUBLE_EQ(legia["position"]["x"].get<double>(), 21000.0);
    EXPECT_EQ(legia["data"]["league"], "Ekstraklasa");
    EXPECT_DOUBLE_EQ(legia["data"]["latitude"].get<double>(), 52.25);
    EXPECT_EQ(legia["color"], "#e53e3e");
    EXPECT_EQ(legia["shape"], "circle");
    EXPECT_FALSE(j["nodes"][1].contains("position"));
    EXPECT_FALSE(j["nodes"][1]["data"].contains("latitude"));

    auto& meta = j["edges"][0]["metadata"];
    EXPECT_EQ(meta["strength"], "strong");
    EXPECT_EQ(meta["start_date"], "1921-01-01");
    EXPECT_FALSE(meta.contains("end_date"));

    EXPECT_EQ(j["metadata"]["total_nodes"], 2);
    EXPECT_EQ(j["metadata"]["connected_components"], 1);
}

// ─── CSV ───────────────────────────────────────────────────────

TEST(ExportTest, CsvSections) {
    const std::string csv = exportCsv(sample());
    const std::string expected =
        "NODES\n"
        "id,label,league,city,founded_year\n"
        "1,\"Legia\",\"Ekstraklasa\",\"Warszawa\",1916\n"
        "2,\"Polonia \"\"Czarne Koszule\"\"\",\"I Liga\",\"Warszawa\",1911\n"
        "\n"
        "EDGES\n"
        "id,source,target,type,weight,strength\n"
        "\"connection-3\",1,2,\"rivalry\",95,\"strong\"\n";
    EXPECT_EQ(csv, expected);
}

// ─── XML Formats ───────────────────────────────────────────────

TEST(ExportTest, GexfDocument) {
    const std::string gexf = exportGexf(sample());
    EXPECT_NE(gexf.find("xmlns=\"http://www.gexf.net/1.2draft\" version=\"1.2\""), std::string::npos);
    EXPECT_NE(gexf.find("defaultedgetype=\"undirected\""), std::string::npos);
    EXPECT_NE(gexf.find("<node id=\"1\" label=\"Legia\"/>"), std::string::npos);
    EXPECT_NE(gexf.find("label=\"Polonia &quot;Czarne Koszule&quot;\""), std::string::npos);
    EXPECT_NE(gexf.find("<edge id=\"connection-3\" source=\"1\" target=\"2\" weight=\"95\"/>"),
              std::string::npos);
}

TEST(ExportTest, GraphMlDocument) {
    const std::string graphml = exportGraphMl(sample());
    EXPECT_NE(graphml.find("<key id=\"label\" for=\"node\""), std::string::npos);
    EXPECT_NE(graphml.find("<key id=\"weight\" for=\"edge\""), std::string::npos);
    EXPECT_NE(graphml.find("<graph id=\"ClubNetwork\" edgedefault=\"undirected\">"), std::string::npos);
    EXPECT_NE(graphml.find("<data key=\"label\">Legia</data>"), std::string::npos);
    EXPECT_NE(graphml.find("<data key=\"weight\">95</data>"), std::string::npos);
}

TEST(ExportTest, XmlEscape) {
    EXPECT_EQ(xmlEscape("a<b & 'c'>"), "a&lt;b &amp; &apos;c&apos;&gt;");
    EXPECT_EQ(xmlEscape("plain"), "plain");
}

TEST(ExportTest, EmptySnapshot) {
    auto j = nlohmann::json::parse(exportJson(GraphSnapshot::empty(), ExportOptions{}));
    EXPECT_TRUE(j["nodes"].empty());
    EXPECT_TRUE(j["edges"].empty());
}
