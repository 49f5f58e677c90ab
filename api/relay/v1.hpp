#pragma once

#include "relay/v1/jsonrpc.pb.h"
#include "relay/v1/history.pb.h"
#include "relay/v1/expirer.pb.h"
#include "relay/v1/publisher.pb.h"
