#ifndef TESSERA_TESSERA_H
#define TESSERA_TESSERA_H

#include "converter.h"
#include "decimal.h"
#include "interval.h"
#include "options.h"
#include "parser.h"
#include "period.h"
#include "slice.h"
#include "source.h"
#include "status.h"
#include "temporal.h"
#include "value.h"

#endif // TESSERA_TESSERA_H
