// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QJsonObject>
#include <QtCore/QLoggingCategory>
#include <QtCore/QStringList>

#include <flowmodel/FlowGraph.hpp>
#include <layout/LayeredLayout.hpp>
#include <session/EditorSettings.hpp>
#include <session/WorkflowDocumentJson.hpp>
#include <utils/filesystem/JsonFileUtils.hpp>

#include <cstdlib>

Q_LOGGING_CATEGORY(applog, "callflow.app")

static constexpr char layoutCommandC[] = "layout";

static void printErrors(const QString& header, const QStringList& errors)
{
	qCCritical(applog).noquote() << header;
	for (const QString& e : errors)
		qCCritical(applog).noquote() << "  " << e;
}

static FlowModel::FlowGraph withPositions(const FlowModel::FlowGraph& graph, const Layout::LayoutResult& laid)
{
	FlowModel::FlowGraph::Builder b(graph);
	for (auto it = laid.positions.cbegin(); it != laid.positions.cend(); ++it) {
		if (!b.setNodePosition(it.key(), it.value()))
			qCWarning(applog).noquote() << "Layout placed unknown node" << it.key().toString();
	}
	return b.freeze();
}

static int runLayout(const QString& inputPath, const QString& outputPath, const Session::EditorSettings& settings)
{
	QJsonObject document;
	const Utils::Result read = Utils::JsonFileUtils::readObject(inputPath, document);
	if (!read) {
		printErrors(QStringLiteral("Cannot read %1.").arg(inputPath), read.errors);
		return EXIT_FAILURE;
	}

	QString name;
	FlowModel::FlowGraph graph;
	const Utils::Result parsed = Session::parseWorkflowDocument(document, name, graph);
	if (!parsed) {
		printErrors(QStringLiteral("%1 is not a workflow document.").arg(inputPath), parsed.errors);
		return EXIT_FAILURE;
	}

	Layout::LayoutResult laid;
	const Utils::Result computed = Layout::computeLayout(graph, settings.layout, laid);
	if (!computed) {
		printErrors(QStringLiteral("Layout failed."), computed.errors);
		return EXIT_FAILURE;
	}

	const QJsonObject out = Session::exportWorkflowDocument(name, withPositions(graph, laid));
	const Utils::Result written = Utils::JsonFileUtils::writeObjectAtomic(outputPath, out);
	if (!written) {
		printErrors(QStringLiteral("Cannot write %1.").arg(outputPath), written.errors);
		return EXIT_FAILURE;
	}

	qCInfo(applog).noquote() << "Laid out" << graph.nodeCount() << "nodes in" << laid.rankCount
	                         << "ranks" << "(" + Layout::directionToString(settings.layout.direction) + ")"
	                         << "->" << outputPath;
	return EXIT_SUCCESS;
}

int main(int argc, char** argv)
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName(QStringLiteral("callflow"));

	QCommandLineParser parser;
	parser.setApplicationDescription(QStringLiteral("Call workflow tools."));
	parser.addHelpOption();
	parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run: layout."));
	parser.addPositionalArgument(QStringLiteral("input"), QStringLiteral("Exported workflow or bare definition (JSON)."));

	const QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
	                                      QStringLiteral("Write the result to <file> instead of the input."),
	                                      QStringLiteral("file"));
	const QCommandLineOption directionOption(QStringLiteral("direction"),
	                                         QStringLiteral("Rank direction, TB or LR."),
	                                         QStringLiteral("dir"));
	const QCommandLineOption configOption(QStringLiteral("config"),
	                                      QStringLiteral("Editor settings file (JSON)."),
	                                      QStringLiteral("file"));
	parser.addOption(outputOption);
	parser.addOption(directionOption);
	parser.addOption(configOption);
	parser.process(app);

	const QStringList args = parser.positionalArguments();
	if (args.size() != 2 || args.first() != QLatin1String(layoutCommandC)) {
		qCCritical(applog).noquote() << "Usage: callflow layout <input.json> [-o output.json]"
		                                " [--direction TB|LR] [--config file]";
		return EXIT_FAILURE;
	}

	Session::EditorSettings settings;
	if (parser.isSet(configOption)) {
		const Utils::Result loaded = Session::loadEditorSettings(parser.value(configOption), settings);
		if (!loaded)
			qCWarning(applog).noquote() << "Settings partially applied:" << loaded.joined();
	}

	if (parser.isSet(directionOption)) {
		Layout::Direction direction;
		if (!Layout::directionFromString(parser.value(directionOption), direction)) {
			qCCritical(applog).noquote() << "Unknown direction" << parser.value(directionOption) << "(expected TB or LR)";
			return EXIT_FAILURE;
		}
		settings.layout.direction = direction;
	}

	const QString input = args.at(1);
	const QString output = parser.isSet(outputOption) ? parser.value(outputOption) : input;
	return runLayout(input, output, settings);
}
