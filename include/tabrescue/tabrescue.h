/**
 * @file tabrescue.h
 * @brief Umbrella header for the tabrescue ingestion library.
 */

#ifndef TABRESCUE_H
#define TABRESCUE_H

#include "dialect.h"
#include "encoding.h"
#include "error.h"
#include "fallback.h"
#include "ingest.h"
#include "io_util.h"
#include "normalizer.h"
#include "options.h"
#include "report.h"
#include "table.h"
#include "tokenizer.h"
#include "writer.h"

#endif // TABRESCUE_H
