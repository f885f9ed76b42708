#pragma once

#include "config.hpp"
#include "extract.hpp"
#include "format.hpp"
#include "graph.hpp"
#include "pipeline.hpp"
#include "report.hpp"
#include "schema.hpp"
#include "udf.hpp"
#include "utils.hpp"
#include "verify.hpp"
#include "writer.hpp"

#define CPGSLICE_VERSION_STRING "0.1.0"
