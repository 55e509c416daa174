#ifndef JQR_RAPIDJSON_INCLUDES_H_
#define JQR_RAPIDJSON_INCLUDES_H_

/*
 * This file includes all RapidJSON headers used by jqr. Any RAPIDJSON-global #defines, etc. belong here
 */

#define RAPIDJSON_HAS_STDSTRING 1

#include <rapidjson/prettywriter.h>
#include <rapidjson/document.h>
#include <rapidjson/reader.h>
#include <rapidjson/memorystream.h>
#include <rapidjson/encodedstream.h>
#include <rapidjson/encodings.h>
#include <rapidjson/error/en.h>
#include <rapidjson/internal/dtoa.h>

#endif  // JQR_RAPIDJSON_INCLUDES_H_
