#pragma once

#include "audit/store/v1/event.pb.h"
#include "audit/store/v1/problem.pb.h"

#include "audit/store/v1/admin_service.pb.h"
#include "audit/store/v1/analytics_service.pb.h"
#include "audit/store/v1/write_service.pb.h"

#include "audit/store/v1/admin_service.grpc.pb.h"
#include "audit/store/v1/analytics_service.grpc.pb.h"
#include "audit/store/v1/write_service.grpc.pb.h"
