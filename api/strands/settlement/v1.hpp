#pragma once

#include "strands/settlement/v1/types.pb.h"

#include "strands/settlement/v1/settlement_service.pb.h"
#include "strands/settlement/v1/promotion_service.pb.h"
#include "strands/settlement/v1/loyalty_service.pb.h"

#include "strands/settlement/v1/settlement_service.grpc.pb.h"
#include "strands/settlement/v1/promotion_service.grpc.pb.h"
#include "strands/settlement/v1/loyalty_service.grpc.pb.h"
