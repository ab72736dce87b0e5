#pragma once

// Trace event query engine: loading, filtering, flows and aggregation

#include "aggregation_metrics.hpp"
#include "composite_key.hpp"
#include "event_aggregator_utility.hpp"
#include "event_export_writer.hpp"
#include "event_loader_utility.hpp"
#include "event_view_utility.hpp"
#include "filter_compiler_utility.hpp"
#include "flow_builder_utility.hpp"
#include "query_config.hpp"
#include "query_error.hpp"
#include "trace_event.hpp"
#include "trace_parser.hpp"
