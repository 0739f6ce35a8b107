#pragma once

#include "auth.hpp"
#include "client_config.hpp"
#include "errors.hpp"
#include "form_data.hpp"
#include "http_request.hpp"
#include "http_response.hpp"
#include "http_types.hpp"
#include "mutable_request.hpp"
#include "native_request.hpp"
#include "parameter_encoder.hpp"
#include "parameters.hpp"
#include "request_builder.hpp"
#include "request_loader.hpp"
#include "requestable.hpp"
#include "response.hpp"
#include "response_modifier.hpp"
#include "url_parser.hpp"
#include "asio_request_loader.hpp"
