#include <QtTest/QtTest>

#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "common/errors.hpp"
#include "extract/architecture_extractor.hpp"
#include "extract/name_resolver.hpp"
#include "graph/diagram_renderer.hpp"
#include "graph/markup_lint.hpp"
#include "graph/relationship_graph.hpp"

namespace {

archscope::RelationshipGraph graphOf(const std::map<std::string, std::string> &files)
{
    archscope::ArchitectureSnapshot snapshot;
    for (const auto &[path, text] : files) {
        snapshot.units.emplace(path, archscope::extract(path, text));
    }
    archscope::rebuildRegistry(snapshot);
    archscope::resolveCallTargets(snapshot);
    return archscope::buildGraph(snapshot).graph;
}

std::vector<std::string> linesOf(const std::string &markup)
{
    std::vector<std::string> lines;
    std::istringstream in(markup);
    std::string line;
    while (std::getline(in, line)) {
        const size_t first = line.find_first_not_of(' ');
        lines.push_back(first == std::string::npos ? std::string() : line.substr(first));
    }
    return lines;
}

bool containsLine(const std::string &markup, const std::string &expected)
{
    for (const auto &line : linesOf(markup)) {
        if (line == expected) {
            return true;
        }
    }
    return false;
}

const std::map<std::string, std::string> kProject = {
    {"src/a.rs", R"(
pub trait Draw { fn draw(&self); }
pub struct Widget { size: u32 }
impl Widget {
    pub fn new() -> Self { Widget { size: 0 } }
}
impl Draw for Widget { fn draw(&self) {} }
pub enum Mode { On, Off = 2 }
)"},
    {"src/b.rs", R"(
use crate::a::*;
pub struct Factory { made: Vec<Widget>, mode: Mode }
impl Factory {
    pub fn make(&mut self) -> Widget { Widget::new() }
}
)"},
};

} // namespace

class DiagramRendererTests : public QObject
{
    Q_OBJECT
private slots:
    void testSanitizeId();
    void testAssignNodeIdsAvoidsCollisions();
    void testClassDiagram();
    void testStateDiagram();
    void testConnectionsCollapseParallelEdges();
    void testConnectionsSkipIsolatedNodes();
    void testEntityDiagram();
    void testRenderedMarkupLintsClean();
    void testLintReportsProblems();
    void testValidateMarkupThrows();
};

void DiagramRendererTests::testSanitizeId()
{
    QCOMPARE(QString::fromStdString(archscope::sanitizeId("crate::a::Widget")),
             QStringLiteral("crate_a_Widget"));
    QCOMPARE(QString::fromStdString(archscope::sanitizeId("r#type")), QStringLiteral("r_type"));
    QCOMPARE(QString::fromStdString(archscope::sanitizeId("end")), QStringLiteral("n_end"));
    QCOMPARE(QString::fromStdString(archscope::sanitizeId("9lives")), QStringLiteral("n_9lives"));
}

void DiagramRendererTests::testAssignNodeIdsAvoidsCollisions()
{
    archscope::RelationshipGraph graph;
    graph.addNode({"crate::a::b", "b", archscope::TypeKind::Struct, {}, {}});
    graph.addNode({"crate::a_b", "a_b", archscope::TypeKind::Struct, {}, {}});

    const auto ids = archscope::assignNodeIds(graph);
    QCOMPARE(QString::fromStdString(ids.at("crate::a::b")), QStringLiteral("crate_a_b"));
    QCOMPARE(QString::fromStdString(ids.at("crate::a_b")), QStringLiteral("crate_a_b_2"));
}

void DiagramRendererTests::testClassDiagram()
{
    const std::string markup = archscope::renderDiagram(graphOf(kProject), archscope::DiagramMode::Class);
    const auto lines = linesOf(markup);
    QCOMPARE(QString::fromStdString(lines.front()), QStringLiteral("classDiagram"));

    QVERIFY(containsLine(markup, "class crate_a_Widget[\"Widget\"] {"));
    QVERIFY(containsLine(markup, "+size: u32"));
    QVERIFY(containsLine(markup, "+new() Self"));
    QVERIFY(containsLine(markup, "-draw(&self)"));
    QVERIFY(containsLine(markup, "<<interface>>"));
    QVERIFY(containsLine(markup, "<<enumeration>>"));
    QVERIFY(containsLine(markup, "+Off = 2"));
    QVERIFY(containsLine(markup, "+made: Vec~Widget~"));

    QVERIFY(containsLine(markup, "crate_a_Widget ..|> crate_a_Draw"));
    QVERIFY(containsLine(markup, "crate_b_Factory --> crate_a_Widget : make calls new"));
    QVERIFY(containsLine(markup, "crate_b_Factory \"1\" *-- \"*\" crate_a_Widget : made"));
    QVERIFY(containsLine(markup, "crate_b_Factory *-- crate_a_Mode : mode"));
    QVERIFY(containsLine(markup, "crate_b_Factory ..> crate_a_Widget : make"));
}

void DiagramRendererTests::testStateDiagram()
{
    const std::string markup = archscope::renderDiagram(graphOf(kProject), archscope::DiagramMode::State);
    QCOMPARE(QString::fromStdString(linesOf(markup).front()), QStringLiteral("stateDiagram-v2"));
    QVERIFY(containsLine(markup, "state \"Factory\" as crate_b_Factory"));
    QVERIFY(containsLine(markup, "crate_b_Factory --> crate_a_Widget : calls make"));
    QVERIFY(containsLine(markup, "crate_b_Factory --> crate_a_Widget : transition make"));
    QVERIFY(containsLine(markup, "crate_a_Widget --> crate_a_Draw : implements"));
}

void DiagramRendererTests::testConnectionsCollapseParallelEdges()
{
    archscope::RelationshipGraph graph;
    graph.addNode({"crate::Car", "Car", archscope::TypeKind::Struct, {}, {}});
    graph.addNode({"crate::Engine", "Engine", archscope::TypeKind::Struct, {}, {}});
    graph.addEdge({"crate::Car", "crate::Engine", archscope::EdgeKind::Calls, "start", "ignite", false});
    graph.addEdge({"crate::Car", "crate::Engine", archscope::EdgeKind::ContainsField, "engine", {}, false});

    const std::string markup = archscope::renderDiagram(graph, archscope::DiagramMode::Connections);
    QCOMPARE(QString::fromStdString(linesOf(markup).front()), QStringLiteral("graph LR"));

    int edgeLines = 0;
    for (const auto &line : linesOf(markup)) {
        if (line.find("-->") != std::string::npos) {
            ++edgeLines;
        }
    }
    QCOMPARE(edgeLines, 1);
    QVERIFY(containsLine(markup, "crate_Car -->|\"engine, start\"| crate_Engine"));
    QVERIFY(containsLine(markup, "crate_Car[\"Car\"]"));
}

void DiagramRendererTests::testConnectionsSkipIsolatedNodes()
{
    archscope::RelationshipGraph graph;
    graph.addNode({"crate::Lonely", "Lonely", archscope::TypeKind::Struct, {}, {}});
    graph.addNode({"crate::A", "A", archscope::TypeKind::Struct, {}, {}});
    graph.addNode({"crate::B", "B", archscope::TypeKind::Trait, {}, {}});
    graph.addEdge({"crate::A", "crate::B", archscope::EdgeKind::Implements, {}, {}, false});

    const std::string markup = archscope::renderDiagram(graph, archscope::DiagramMode::Connections);
    QVERIFY(markup.find("Lonely") == std::string::npos);
    QVERIFY(containsLine(markup, "crate_A --> crate_B"));
}

void DiagramRendererTests::testEntityDiagram()
{
    const std::string markup = archscope::renderDiagram(graphOf(kProject), archscope::DiagramMode::Entity);
    QCOMPARE(QString::fromStdString(linesOf(markup).front()), QStringLiteral("erDiagram"));

    QVERIFY(containsLine(markup, "crate_b_Factory {"));
    QVERIFY(containsLine(markup, "Vec_Widget made"));
    QVERIFY(containsLine(markup, "crate_b_Factory ||--o{ crate_a_Widget : \"made\""));
    QVERIFY(containsLine(markup, "crate_b_Factory ||--|| crate_a_Mode : \"mode\""));
    // Only containment is drawn.
    QVERIFY(markup.find("crate_a_Draw") == std::string::npos);
}

void DiagramRendererTests::testRenderedMarkupLintsClean()
{
    const auto graph = graphOf(kProject);
    for (const auto mode : {archscope::DiagramMode::Class, archscope::DiagramMode::State,
                            archscope::DiagramMode::Connections, archscope::DiagramMode::Entity}) {
        const std::string markup = archscope::renderDiagram(graph, mode);
        QVERIFY(archscope::lintMarkup(markup, mode).empty());
    }
}

void DiagramRendererTests::testLintReportsProblems()
{
    QVERIFY(!archscope::lintMarkup("flowchart TD\n", archscope::DiagramMode::Connections).empty());
    QVERIFY(!archscope::lintMarkup("", archscope::DiagramMode::Class).empty());

    const auto undeclared = archscope::lintMarkup("graph LR\n    a[\"A\"]\n    a --> b\n",
                                                  archscope::DiagramMode::Connections);
    QCOMPARE(static_cast<int>(undeclared.size()), 1);
    QVERIFY(QString::fromStdString(undeclared.front()).contains(QStringLiteral("'b'")));

    const auto unclosed = archscope::lintMarkup("classDiagram\n    class a[\"A\"] {\n        +x: u8\n",
                                                archscope::DiagramMode::Class);
    QCOMPARE(static_cast<int>(unclosed.size()), 1);

    const auto quotes = archscope::lintMarkup("stateDiagram-v2\n    state \"A as a\n",
                                              archscope::DiagramMode::State);
    QVERIFY(!quotes.empty());

    const auto badId = archscope::lintMarkup("classDiagram\n    class a::b[\"B\"]\n",
                                             archscope::DiagramMode::Class);
    QCOMPARE(static_cast<int>(badId.size()), 1);
}

void DiagramRendererTests::testValidateMarkupThrows()
{
    try {
        archscope::validateMarkup("classDiagram\n    a --> b\n", archscope::DiagramMode::Class);
        QFAIL("expected RenderMarkupError");
    } catch (const archscope::RenderMarkupError &error) {
        QVERIFY(QString::fromUtf8(error.what()).contains(QStringLiteral("undeclared")));
    }
}

QTEST_MAIN(DiagramRendererTests)
#include "test_diagram_renderer.moc"
