#pragma once

// Single include for the whole library.

#include <yv/breadcrumb.h>
#include <yv/cli_args.h>
#include <yv/context.h>
#include <yv/debug.h>
#include <yv/errors.h>
#include <yv/json.h>
#include <yv/limits.h>
#include <yv/node.h>
#include <yv/parse.h>
#include <yv/schema.h>
#include <yv/utils.h>
#include <yv/yaml.h>
