// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "layout/LayeredLayout.hpp"

#include "utils/Macros.hpp"

#include <QtCore/QMap>
#include <QtCore/QSet>
#include <QtCore/QVector>

#include <algorithm>
#include <functional>
#include <queue>
#include <vector>

Q_LOGGING_CATEGORY(layoutlog, "callflow.layout")

namespace Layout {

namespace {

using FlowModel::NodeKind;

struct RankEdge final {
    int from = 0;
    int to = 0;
};

// Real nodes occupy [0, realCount); dummy vertices for long edges follow.
struct LayerGraph final {
    int realCount = 0;
    QVector<int> rank;
    QVector<QVector<int>> up;
    QVector<QVector<int>> down;
    QVector<QVector<int>> layers;

    bool isDummy(int v) const noexcept { return v >= realCount; }

    int addVertex(int r)
    {
        rank.push_back(r);
        up.push_back({});
        down.push_back({});
        return static_cast<int>(rank.size()) - 1;
    }

    void link(int from, int to)
    {
        down[from].push_back(to);
        up[to].push_back(from);
    }
};

QVector<RankEdge> dedupe(const QVector<RankEdge>& edges)
{
    QVector<RankEdge> unique;
    QSet<QPair<int, int>> seen;
    for (const RankEdge& e : edges) {
        const QPair<int, int> key(e.from, e.to);
        if (seen.contains(key))
            continue;
        seen.insert(key);
        unique.push_back(e);
    }
    return unique;
}

// Orients every edge so Start nodes are sources and End nodes are sinks.
// Edges joining two nodes of the same pinned kind cannot satisfy both pins and
// are left out of ranking.
Utils::Result collectRankEdges(const FlowModel::FlowGraph& graph,
                               const QHash<FlowModel::NodeId, int>& indexOf,
                               const QVector<NodeKind>& kinds,
                               QVector<RankEdge>& out)
{
    out.clear();
    for (const FlowModel::EdgeId& id : graph.edgeIds()) {
        const FlowModel::Edge* edge = graph.tryEdge(id);
        const auto s = indexOf.constFind(edge->source);
        const auto t = indexOf.constFind(edge->target);
        if (s == indexOf.cend() || t == indexOf.cend()) {
            qCCritical(layoutlog).noquote()
                << "Edge" << id.toString() << "references a missing node"
                << (s == indexOf.cend() ? edge->source.toString() : edge->target.toString());
            UTILS_ASSERT_MSG(false, "dangling edge passed to computeLayout");
            return Utils::Result::failure(
                QStringLiteral("Edge '%1' references a missing node.").arg(id.toString()));
        }

        int from = *s;
        int to = *t;
        if (from == to)
            continue;
        if (kinds[to] == NodeKind::Start || kinds[from] == NodeKind::End)
            std::swap(from, to);
        if (kinds[from] == kinds[to] && (kinds[from] == NodeKind::Start || kinds[from] == NodeKind::End))
            continue;
        out.push_back({from, to});
    }
    out = dedupe(out);
    return Utils::Result::success();
}

// Reverses DFS back edges. Roots are visited Start first, then graph order.
QVector<RankEdge> breakCycles(int nodeCount, const QVector<RankEdge>& edges, const QVector<int>& roots)
{
    QVector<QVector<int>> outgoing(nodeCount);
    for (qsizetype i = 0; i < edges.size(); ++i)
        outgoing[edges[i].from].push_back(static_cast<int>(i));

    enum : quint8 { Unvisited, OnStack, Done };
    QVector<quint8> state(nodeCount, Unvisited);
    QVector<bool> reversed(edges.size(), false);

    for (const int root : roots) {
        if (state[root] != Unvisited)
            continue;

        QVector<QPair<int, int>> stack; // vertex, next outgoing slot
        stack.push_back({root, 0});
        state[root] = OnStack;

        while (!stack.isEmpty()) {
            const int v = stack.back().first;
            const int slot = stack.back().second;
            if (slot >= outgoing[v].size()) {
                state[v] = Done;
                stack.pop_back();
                continue;
            }
            stack.back().second = slot + 1;

            const int edgeIndex = outgoing[v][slot];
            const int next = edges[edgeIndex].to;
            if (state[next] == OnStack) {
                reversed[edgeIndex] = true;
            } else if (state[next] == Unvisited) {
                state[next] = OnStack;
                stack.push_back({next, 0});
            }
        }
    }

    QVector<RankEdge> acyclic;
    acyclic.reserve(edges.size());
    for (qsizetype i = 0; i < edges.size(); ++i) {
        if (reversed[i])
            acyclic.push_back({edges[i].to, edges[i].from});
        else
            acyclic.push_back(edges[i]);
    }
    return dedupe(acyclic);
}

// Longest path from the sources; ties in the ready set go to the lower index.
QVector<int> longestPathRanks(int nodeCount, const QVector<RankEdge>& edges)
{
    QVector<QVector<int>> successors(nodeCount);
    QVector<int> inDegree(nodeCount, 0);
    for (const RankEdge& e : edges) {
        successors[e.from].push_back(e.to);
        ++inDegree[e.to];
    }

    std::priority_queue<int, std::vector<int>, std::greater<int>> ready;
    for (int v = 0; v < nodeCount; ++v) {
        if (inDegree[v] == 0)
            ready.push(v);
    }

    QVector<int> rank(nodeCount, 0);
    int visited = 0;
    while (!ready.empty()) {
        const int v = ready.top();
        ready.pop();
        ++visited;
        for (const int w : successors[v]) {
            rank[w] = std::max(rank[w], rank[v] + 1);
            if (--inDegree[w] == 0)
                ready.push(w);
        }
    }
    UTILS_ASSERT_MSG(visited == nodeCount, "rank graph still cyclic after cycle breaking");
    return rank;
}

void pinEndNodes(const QVector<NodeKind>& kinds, QVector<int>& rank)
{
    int lastOther = -1;
    for (qsizetype v = 0; v < rank.size(); ++v) {
        if (kinds[v] != NodeKind::End)
            lastOther = std::max(lastOther, rank[v]);
    }
    for (qsizetype v = 0; v < rank.size(); ++v) {
        if (kinds[v] == NodeKind::End)
            rank[v] = lastOther + 1;
    }
}

LayerGraph buildLayers(const QVector<int>& rank, const QVector<RankEdge>& edges)
{
    LayerGraph g;
    g.realCount = static_cast<int>(rank.size());
    for (const int r : rank)
        g.addVertex(r);

    for (const RankEdge& e : edges) {
        int previous = e.from;
        for (int r = rank[e.from] + 1; r < rank[e.to]; ++r) {
            const int dummy = g.addVertex(r);
            g.link(previous, dummy);
            previous = dummy;
        }
        g.link(previous, e.to);
    }

    int rankCount = 0;
    for (const int r : g.rank)
        rankCount = std::max(rankCount, r + 1);
    g.layers.resize(rankCount);
    for (qsizetype v = 0; v < g.rank.size(); ++v)
        g.layers[g.rank[v]].push_back(static_cast<int>(v));
    return g;
}

QVector<int> orderPositions(const LayerGraph& g, const QVector<QVector<int>>& layers)
{
    QVector<int> pos(g.rank.size(), 0);
    for (const QVector<int>& layer : layers) {
        for (qsizetype i = 0; i < layer.size(); ++i)
            pos[layer[i]] = static_cast<int>(i);
    }
    return pos;
}

qint64 countCrossings(const LayerGraph& g, const QVector<QVector<int>>& layers)
{
    const QVector<int> pos = orderPositions(g, layers);
    qint64 crossings = 0;
    for (qsizetype r = 0; r + 1 < layers.size(); ++r) {
        QVector<QPair<int, int>> segments;
        for (const int v : layers[r]) {
            for (const int w : g.down[v])
                segments.push_back({pos[v], pos[w]});
        }
        for (qsizetype i = 0; i < segments.size(); ++i) {
            for (qsizetype j = i + 1; j < segments.size(); ++j) {
                const int a = segments[i].first - segments[j].first;
                const int b = segments[i].second - segments[j].second;
                if ((a < 0 && b > 0) || (a > 0 && b < 0))
                    ++crossings;
            }
        }
    }
    return crossings;
}

void reorderByBarycenter(QVector<int>& layer, const QVector<QVector<int>>& neighbours, QVector<int>& pos)
{
    QHash<int, double> barycenter;
    for (const int v : layer) {
        const QVector<int>& adjacent = neighbours[v];
        if (adjacent.isEmpty()) {
            barycenter.insert(v, pos[v]);
            continue;
        }
        double sum = 0.0;
        for (const int w : adjacent)
            sum += pos[w];
        barycenter.insert(v, sum / static_cast<double>(adjacent.size()));
    }

    std::stable_sort(layer.begin(), layer.end(), [&](int a, int b) {
        return barycenter.value(a) < barycenter.value(b);
    });
    for (qsizetype i = 0; i < layer.size(); ++i)
        pos[layer[i]] = static_cast<int>(i);
}

void reduceCrossings(LayerGraph& g, int sweeps)
{
    if (g.layers.size() < 2)
        return;

    QVector<QVector<int>> best = g.layers;
    qint64 bestCrossings = countCrossings(g, best);

    QVector<QVector<int>> layers = g.layers;
    for (int sweep = 0; sweep < sweeps && bestCrossings > 0; ++sweep) {
        QVector<int> pos = orderPositions(g, layers);
        if (sweep % 2 == 0) {
            for (qsizetype r = 1; r < layers.size(); ++r)
                reorderByBarycenter(layers[r], g.up, pos);
        } else {
            for (qsizetype r = layers.size() - 2; r >= 0; --r)
                reorderByBarycenter(layers[r], g.down, pos);
        }

        const qint64 crossings = countCrossings(g, layers);
        if (crossings < bestCrossings) {
            best = layers;
            bestCrossings = crossings;
        }
    }

    g.layers = best;
}

bool isZigzagExempt(NodeKind kind)
{
    return FlowModel::isTerminalKind(kind);
}

} // namespace

Utils::Result computeLayout(const FlowModel::FlowGraph& graph, const LayoutOptions& options, LayoutResult& out)
{
    out = LayoutResult{};

    const QVector<FlowModel::NodeId>& nodeIds = graph.nodeIds();
    const int nodeCount = static_cast<int>(nodeIds.size());
    if (nodeCount == 0)
        return Utils::Result::success();

    QHash<FlowModel::NodeId, int> indexOf;
    QVector<NodeKind> kinds(nodeCount);
    QVector<int> roots;
    for (int i = 0; i < nodeCount; ++i) {
        indexOf.insert(nodeIds[i], i);
        kinds[i] = graph.tryNode(nodeIds[i])->kind();
        if (kinds[i] == NodeKind::Start)
            roots.push_back(i);
    }
    for (int i = 0; i < nodeCount; ++i) {
        if (kinds[i] != NodeKind::Start)
            roots.push_back(i);
    }

    QVector<RankEdge> edges;
    const Utils::Result collected = collectRankEdges(graph, indexOf, kinds, edges);
    if (!collected)
        return collected;

    edges = breakCycles(nodeCount, edges, roots);
    QVector<int> rank = longestPathRanks(nodeCount, edges);
    pinEndNodes(kinds, rank);

    LayerGraph layered = buildLayers(rank, edges);
    reduceCrossings(layered, options.crossingSweeps);

    const bool topToBottom = options.direction == Direction::TopToBottom;
    const double crossExtent = topToBottom ? options.nodeWidth : options.nodeHeight;
    const double rankExtent = topToBottom ? options.nodeHeight : options.nodeWidth;
    const double rankStep = rankExtent + options.rankSeparation;

    // Cross-axis centers: nodes packed with nodeSeparation between footprints,
    // dummies take no room of their own, each layer centred on 0.
    QVector<double> cross(layered.rank.size(), 0.0);
    for (const QVector<int>& layer : layered.layers) {
        double cursor = 0.0;
        double previousExtent = 0.0;
        for (qsizetype i = 0; i < layer.size(); ++i) {
            const double extent = layered.isDummy(layer[i]) ? 0.0 : crossExtent;
            if (i > 0)
                cursor += (previousExtent + extent) / 2.0 + options.nodeSeparation;
            cross[layer[i]] = cursor;
            previousExtent = extent;
        }
        const double shift = layer.isEmpty() ? 0.0 : cursor / 2.0;
        for (const int v : layer)
            cross[v] -= shift;
    }

    // De-overlap: a row holding a single non-terminal node is pushed off the
    // axis, alternating sides, so linear chains do not stack into one line.
    const double tolerance = options.rankTolerance > 0.0 ? options.rankTolerance : kDefaultRankTolerance;
    QMap<qint64, QVector<int>> rows;
    for (int v = 0; v < nodeCount; ++v)
        rows[qRound64(rank[v] * rankStep / tolerance)].push_back(v);

    int rowIndex = 0;
    for (auto it = rows.cbegin(); it != rows.cend(); ++it, ++rowIndex) {
        int candidate = -1;
        int nonTerminal = 0;
        for (const int v : it.value()) {
            if (isZigzagExempt(kinds[v]))
                continue;
            ++nonTerminal;
            candidate = v;
        }
        if (nonTerminal != 1)
            continue;
        cross[candidate] += (rowIndex % 2 == 0) ? options.zigzagOffset : -options.zigzagOffset;
    }

    const QPointF halfSize(options.nodeWidth / 2.0, options.nodeHeight / 2.0);
    for (int v = 0; v < nodeCount; ++v) {
        const double along = rank[v] * rankStep;
        const QPointF center = topToBottom ? QPointF(cross[v], along) : QPointF(along, cross[v]);
        out.positions.insert(nodeIds[v], center - halfSize);
        out.ranks.insert(nodeIds[v], rank[v]);
    }
    out.rankCount = static_cast<int>(layered.layers.size());

    qCDebug(layoutlog).noquote()
        << "Laid out" << nodeCount << "nodes on" << out.rankCount << "ranks,"
        << (layered.rank.size() - nodeCount) << "dummy vertices, direction"
        << directionToString(options.direction);
    return Utils::Result::success();
}

} // namespace Layout
