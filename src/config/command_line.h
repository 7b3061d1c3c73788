#pragma once
#include "protocol/result.h"
#include <QCommandLineParser>

class ConfigStore;

// Registers --config, --host, --port, --log-dir and --debug.
void addCommandLineOptions(QCommandLineParser& parser);

// Loads the --config file into `store` (writing defaults when it does not
// exist yet), then applies the remaining options on top of it.
VoidResult applyCommandLine(const QCommandLineParser& parser, ConfigStore& store);
