#pragma once

#include <string>

#include "config.h"
#include "header_set.h"

std::string UsageText(const char *argv0);

// Startup banner: the configured title plus URL, root and isolation headers.
std::string BannerText(const ServerConfig &config, const coiserve::HeaderSet &headers);
