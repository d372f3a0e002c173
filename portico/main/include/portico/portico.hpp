#pragma once

#include "portico/http-constants.hpp"
#include "portico/http-method.hpp"
#include "portico/http-request.hpp"
#include "portico/http-response.hpp"
#include "portico/http-status-code.hpp"
#include "portico/interceptor.hpp"
#include "portico/route-table.hpp"
#include "portico/server-config.hpp"
#include "portico/server-options.hpp"
#include "portico/server-stats.hpp"
#include "portico/server.hpp"
#include "portico/socket.hpp"
#include "portico/tls-config-error.hpp"
#include "portico/tls-mode.hpp"
