// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QFileInfo>
#include <QtCore/QLoggingCategory>
#include <QtCore/QStringList>

#include <QtWidgets/QApplication>
#include <QtWidgets/QMainWindow>

#include "floorplan/FloorPlanSettings.hpp"
#include "floorplan/controllers/FloorPlanLayoutController.hpp"
#include "floorplan/service/InMemorySlotService.hpp"
#include "floorplan/service/SampleVenue.hpp"
#include "floorplan/widgets/FloorPlanLayoutWidget.hpp"

using namespace FloorPlan;

static void printErrorsAndFail(const QString& header, const QStringList& errors)
{
	qCritical().noquote() << header;
	for (const QString& e : errors)
		qCritical().noquote() << "  " << e;
}

static FloorPlanSettings resolveSettings(const QCommandLineParser& parser,
                                         const QCommandLineOption& configOpt,
                                         const QCommandLineOption& venueOpt,
                                         const QCommandLineOption& zoneOpt,
                                         const QCommandLineOption& latencyOpt,
                                         const QCommandLineOption& emptyOpt)
{
	FloorPlanSettings settings;
	if (parser.isSet(configOpt)) {
		const QString path = parser.value(configOpt);
		if (!QFileInfo::exists(path))
			qWarning().noquote() << "Config file" << path << "not found, using defaults";
		else
			settings = FloorPlanSettings::loadFile(path);
	}

	if (parser.isSet(venueOpt))
		settings.venueId = parser.value(venueOpt);
	if (parser.isSet(zoneOpt))
		settings.zone = parser.value(zoneOpt);
	if (parser.isSet(latencyOpt)) {
		bool ok = false;
		const int ms = parser.value(latencyOpt).toInt(&ok);
		settings.serviceLatencyMs = ok ? ms : -1;
	}
	if (parser.isSet(emptyOpt))
		settings.seedSampleData = false;
	return settings;
}

int main(int argc, char** argv)
{
	QApplication app(argc, argv);
	QCoreApplication::setApplicationName(QStringLiteral("floorplan-demo"));
	QCoreApplication::setOrganizationName(QStringLiteral("FloorPlan"));

	QCommandLineParser parser;
	parser.setApplicationDescription(QStringLiteral("Venue floor plan editor"));
	parser.addHelpOption();

	const QCommandLineOption configOpt(QStringList{QStringLiteral("c"), QStringLiteral("config")},
	                                   QStringLiteral("Read settings from <file> (INI)."),
	                                   QStringLiteral("file"));
	const QCommandLineOption venueOpt(QStringLiteral("venue"), QStringLiteral("Venue to open."),
	                                  QStringLiteral("id"));
	const QCommandLineOption zoneOpt(QStringLiteral("zone"), QStringLiteral("Initial zone filter."),
	                                 QStringLiteral("name"));
	const QCommandLineOption latencyOpt(QStringLiteral("latency"),
	                                    QStringLiteral("Simulated service latency in milliseconds."),
	                                    QStringLiteral("ms"));
	const QCommandLineOption emptyOpt(QStringLiteral("empty"), QStringLiteral("Start without sample slots."));
	parser.addOptions({configOpt, venueOpt, zoneOpt, latencyOpt, emptyOpt});
	parser.process(app);

	const FloorPlanSettings settings = resolveSettings(parser, configOpt, venueOpt, zoneOpt, latencyOpt, emptyOpt);
	const Utils::Result valid = settings.validate();
	if (!valid) {
		printErrorsAndFail(QStringLiteral("Invalid settings."), valid.errors);
		return EXIT_FAILURE;
	}

	Service::InMemorySlotService service;
	service.setLatencyMs(settings.serviceLatencyMs);
	if (settings.seedSampleData)
		service.seedSlots(settings.venueId, Service::sampleVenueSlots());

	FloorPlanLayoutController controller(&service);

	QMainWindow window;
	auto* layout = new FloorPlanLayoutWidget(&controller, &window);
	layout->setViewportPadding(settings.viewportPadding);
	window.setCentralWidget(layout);
	window.setWindowTitle(QStringLiteral("Floor Plan - %1").arg(settings.venueId));
	window.resize(1200, 800);
	window.show();

	if (!settings.zone.isEmpty())
		controller.setZoneFilter(settings.zone);
	controller.setVenueId(settings.venueId);

	return app.exec();
}
