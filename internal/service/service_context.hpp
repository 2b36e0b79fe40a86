#pragma once

#include <memory>

namespace strands::core {
class SettlementEngine;
class PromotionIssuer;
} // namespace strands::core
namespace strands::db {
class Repository;
}

namespace strands::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<strands::core::SettlementEngine> settlement;
  std::shared_ptr<strands::core::PromotionIssuer>  promotions;
  std::shared_ptr<strands::db::Repository>         repository;
};

} // namespace strands::service
