#pragma once

#define MARGA_VERSION "0.4.0"
#define MARGA_CACHE_FORMAT_VERSION 1
