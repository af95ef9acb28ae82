#pragma once

#include "ledger/v1/types.pb.h"

#include "ledger/v1/admin_service.pb.h"
#include "ledger/v1/balance_service.pb.h"
#include "ledger/v1/exclusion_service.pb.h"

#include "ledger/v1/admin_service.grpc.pb.h"
#include "ledger/v1/balance_service.grpc.pb.h"
#include "ledger/v1/exclusion_service.grpc.pb.h"
