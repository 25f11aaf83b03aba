// filename: oceanparse.hpp
// part of OCEAN Spectroscopy Output Parser
// MIT License

#pragma once

#include "archive.hpp"
#include "archive_json.hpp"
#include "child_builder.hpp"
#include "configuration.hpp"
#include "discovery.hpp"
#include "elements.hpp"
#include "errors.hpp"
#include "extractors.hpp"
#include "io_csv.hpp"
#include "logging.hpp"
#include "method_mapper.hpp"
#include "parser.hpp"
#include "types.hpp"
#include "units.hpp"
#include "workflow.hpp"
