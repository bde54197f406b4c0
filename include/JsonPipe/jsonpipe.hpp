#pragma once

#include "errors.hpp"
#include "error_formatting.hpp"
#include "options.hpp"
#include "token.hpp"
#include "pipeline.hpp"
#include "tokenizer.hpp"
#include "utf8.hpp"
#include "value.hpp"
#include "serializer.hpp"
#include "assembler.hpp"
#include "filter.hpp"
#include "streamers.hpp"
#include "source.hpp"
#include "cursor.hpp"
#include "parse.hpp"
#include "paginator.hpp"
#include "log.hpp"
