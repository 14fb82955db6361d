/* osgWeather
 * Copyright 2025 Pelican Mapping
 * MIT License
 */
#include <osgWeather/Threading>

// weejobs runtime singleton
WEEJOBS_INSTANCE;

const char* osgWeather::Threading::FETCH_POOL_NAME = "osgweather.fetch";
