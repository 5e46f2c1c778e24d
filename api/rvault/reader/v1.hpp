#pragma once

#include "rvault/reader/v1/types.pb.h"
#include "rvault/reader/v1/reader_service.pb.h"
#include "rvault/reader/v1/reader_service.grpc.pb.h"
