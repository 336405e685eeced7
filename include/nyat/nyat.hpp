#ifndef NYAT_HEADER
#define NYAT_HEADER

#include "error.hpp"
#include "mapping_info.hpp"
#include "mapping_handler.hpp"
#include "change_detector.hpp"
#include "stun.hpp"
#include "remote_address.hpp"
#include "local_address.hpp"
#include "reuse_port.hpp"
#include "mapper_config.hpp"
#include "mapper.hpp"
#include "udp_mapper.hpp"
#include "tcp_mapper.hpp"
#include "mapper_builder.hpp"
#include "mapper_group.hpp"

#endif // NYAT_HEADER
