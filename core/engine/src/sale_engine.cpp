#include "tokensale/engine/sale_engine.hpp"

#include "tokensale/codec/json_codec.hpp"
#include "tokensale/errors/sale_error.hpp"
#include "tokensale/ledger/unit_of_work.hpp"

#include <iostream>
#include <utility>

namespace tokensale {

using domain::Address;
using domain::Amount;
using domain::SaleIndex;
using nlohmann::json;

// -----------------------------------------------------------------------------
// Constructor: wire components in dependency order
// -----------------------------------------------------------------------------
SaleEngine::SaleEngine(const EngineConfig& config, const ITimeProvider& clock)
    : clock_(clock),
      cmd_endpoint_(config.command_endpoint),
      pub_endpoint_(config.publish_endpoint),
      access_(config.admin),
      settings_(access_, config.payment),
      registry_(access_, config.sale_address),
      oracle_(directory_, settings_),
      disbursement_(directory_, config.sale_address),
      purchases_(registry_, settings_, access_, oracle_, disbursement_,
                 directory_, guard_, sequence_, clock_, bus_) {
  if (domain::isZeroAddress(config.sale_address)) {
    throw ValidationError("sale address must not be empty");
  }
}

SaleEngine::~SaleEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void SaleEngine::start() {
  if (running_) {
    return;
  }

  // IPC is optional; tests leave the endpoints empty.
  if (!cmd_endpoint_.empty() && !pub_endpoint_.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        cmd_endpoint_, pub_endpoint_);
    ipc_server_->start();

    ipc_subscription_ = bus_.subscribe(
        [this](const Event& e) { ipc_server_->pushNotification(e); });
  }

  running_ = true;

  std::cout << "[SaleEngine] started. admin=" << access_.owner()
            << " sale_address=" << registry_.saleAddress()
            << " sales=" << registry_.count()
            << (ipc_server_ ? " ipc=on" : " ipc=off") << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void SaleEngine::stop() {
  if (!running_) {
    return;
  }

  // Join the IPC thread first: a command it is still handling may publish
  // through the subscriber below, which dereferences ipc_server_.
  if (ipc_server_) {
    ipc_server_->stop();
  }
  if (ipc_subscription_) {
    bus_.unsubscribe(*ipc_subscription_);
    ipc_subscription_.reset();
  }
  ipc_server_.reset();

  running_ = false;

  std::cout << "[SaleEngine] stopped.\n";
}

// -----------------------------------------------------------------------------
// runAdmin(): operation frame for administrator mutations
// -----------------------------------------------------------------------------
template <typename Fn>
void SaleEngine::runAdmin(const char* operation, Fn&& fn) {
  std::vector<Event> events;
  try {
    ReentrancyGuard::Scope scope(guard_, operation);
    UnitOfWork uow(sequence_, clock_);
    fn(uow);
    events = uow.commit();
  } catch (const SaleError& e) {
    std::cerr << "[SaleEngine] " << operation << " rejected ("
              << errorKindToString(e.kind()) << "): " << e.what() << "\n";
    throw;
  }
  bus_.publishAll(events);
}

// -----------------------------------------------------------------------------
// Administrator operations
// -----------------------------------------------------------------------------
SaleIndex SaleEngine::createSale(const Address& caller,
                                 const domain::SaleParams& params) {
  SaleIndex index = 0;
  runAdmin("createSale", [&](UnitOfWork& uow) {
    index = registry_.create(caller, params, uow);
  });
  return index;
}

void SaleEngine::setPrice(const Address& caller, SaleIndex index,
                          const Amount& price_in_usd) {
  runAdmin("setPrice", [&](UnitOfWork& uow) {
    registry_.setPrice(caller, index, price_in_usd, uow);
  });
}

void SaleEngine::setMaxTokens(const Address& caller, SaleIndex index,
                              const Amount& max_tokens) {
  runAdmin("setMaxTokens", [&](UnitOfWork& uow) {
    registry_.setMaxTokens(caller, index, max_tokens, uow);
  });
}

void SaleEngine::setStartDate(const Address& caller, SaleIndex index,
                              domain::UnixTime start_date) {
  runAdmin("setStartDate", [&](UnitOfWork& uow) {
    registry_.setStartDate(caller, index, start_date, uow);
  });
}

void SaleEngine::setEndDate(const Address& caller, SaleIndex index,
                            domain::UnixTime end_date) {
  runAdmin("setEndDate", [&](UnitOfWork& uow) {
    registry_.setEndDate(caller, index, end_date, uow);
  });
}

void SaleEngine::setAssetAddress(const Address& caller, SaleIndex index,
                                 const Address& asset_address) {
  runAdmin("setAssetAddress", [&](UnitOfWork& uow) {
    registry_.setAssetAddress(caller, index, asset_address, uow);
  });
}

void SaleEngine::setPaused(const Address& caller, SaleIndex index,
                           bool paused) {
  runAdmin("setPaused", [&](UnitOfWork& uow) {
    registry_.setPaused(caller, index, paused, uow);
  });
}

void SaleEngine::setStablecoin(const Address& caller, StableSlot slot,
                               const Address& token) {
  runAdmin("setStablecoin", [&](UnitOfWork& uow) {
    settings_.setStablecoin(caller, slot, token, uow);
  });
}

void SaleEngine::setPriceOracle(const Address& caller, const Address& feed) {
  runAdmin("setPriceOracle", [&](UnitOfWork& uow) {
    settings_.setPriceOracle(caller, feed, uow);
  });
}

void SaleEngine::transferOwnership(const Address& caller,
                                   const Address& new_owner) {
  runAdmin("transferOwnership", [&](UnitOfWork& uow) {
    access_.transferOwnership(caller, new_owner, uow);
  });
}

void SaleEngine::withdrawForeignAsset(const Address& caller,
                                      const Address& asset,
                                      const Amount& amount) {
  runAdmin("withdrawForeignAsset", [&](UnitOfWork& uow) {
    access_.requireOwner(caller, "withdrawForeignAsset");
    if (amount == 0) {
      throw ValidationError("withdrawForeignAsset: amount is zero");
    }
    auto token = directory_.token(asset);
    if (!token) {
      throw TransferFailureError("no token registered at '" + asset + "'");
    }
    directory_.enlist(uow, asset);
    const Address to = access_.owner();
    if (!token->transfer(registry_.saleAddress(), to, amount)) {
      throw TransferFailureError("withdrawing " + domain::formatAmount(amount) +
                                 " '" + asset + "' from the sale address failed");
    }

    ForeignAssetWithdrawnEvent event;
    event.asset = asset;
    event.to = to;
    event.amount = amount;
    uow.emit(std::move(event));
  });
}

Amount SaleEngine::withdrawNativeBalance(const Address& caller) {
  Amount moved{0};
  runAdmin("withdrawNativeBalance", [&](UnitOfWork& uow) {
    access_.requireOwner(caller, "withdrawNativeBalance");
    auto bank = directory_.nativeBank();
    if (!bank) {
      throw TransferFailureError("no native currency bank configured");
    }
    const Amount balance = bank->balanceOf(registry_.saleAddress());
    if (balance == 0) {
      throw ValidationError("withdrawNativeBalance: nothing to withdraw");
    }
    directory_.enlistNativeBank(uow);
    const Address to = access_.owner();
    if (!bank->transfer(registry_.saleAddress(), to, balance)) {
      throw TransferFailureError("withdrawing native balance failed");
    }

    NativeWithdrawnEvent event;
    event.to = to;
    event.amount = balance;
    uow.emit(std::move(event));
    moved = balance;
  });
  return moved;
}

// -----------------------------------------------------------------------------
// Purchases
// -----------------------------------------------------------------------------
TokensBoughtEvent SaleEngine::buyWithStablecoinA(const Address& buyer,
                                                 SaleIndex index,
                                                 const Amount& amount,
                                                 const std::string& referral_code) {
  return purchases_.buyWithStable(buyer, index,
                                  settings_.stablecoin(StableSlot::A), amount,
                                  referral_code);
}

TokensBoughtEvent SaleEngine::buyWithStablecoinB(const Address& buyer,
                                                 SaleIndex index,
                                                 const Amount& amount,
                                                 const std::string& referral_code) {
  return purchases_.buyWithStable(buyer, index,
                                  settings_.stablecoin(StableSlot::B), amount,
                                  referral_code);
}

TokensBoughtEvent SaleEngine::buyWithStable(const Address& buyer,
                                            SaleIndex index,
                                            const Address& pay_token,
                                            const Amount& amount,
                                            const std::string& referral_code) {
  return purchases_.buyWithStable(buyer, index, pay_token, amount,
                                  referral_code);
}

TokensBoughtEvent SaleEngine::buyWithNative(const Address& buyer,
                                            SaleIndex index,
                                            const Amount& native_sent,
                                            const std::string& referral_code) {
  return purchases_.buyWithNative(buyer, index, native_sent, referral_code);
}

// -----------------------------------------------------------------------------
// Reads
// -----------------------------------------------------------------------------
domain::Sale SaleEngine::sale(SaleIndex index) const {
  return registry_.get(index);
}

std::size_t SaleEngine::saleCount() const { return registry_.count(); }

std::vector<domain::Sale> SaleEngine::sales() const {
  return registry_.sales();
}

Address SaleEngine::owner() const { return access_.owner(); }

PaymentSettingsSnapshot SaleEngine::paymentSettings() const {
  return settings_.snapshot();
}

const Address& SaleEngine::saleAddress() const {
  return registry_.saleAddress();
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string SaleEngine::executeCommand(const std::string& request) {
  json response;
  try {
    json parsed = json::parse(request);
    response = dispatch(parsed);
    response["status"] = "ok";
  } catch (const json::parse_error& e) {
    response = json::object();
    response["status"] = "error";
    response["error"] = errorKindToString(ErrorKind::Validation);
    response["response"] = std::string("malformed request: ") + e.what();
  } catch (const SaleError& e) {
    response = json::object();
    response["status"] = "error";
    response["error"] = errorKindToString(e.kind());
    response["response"] = e.what();
  } catch (const std::exception& e) {
    std::cerr << "[SaleEngine] command failed: " << e.what() << "\n";
    response = json::object();
    response["status"] = "error";
    response["error"] = "Internal";
    response["response"] = e.what();
  }
  return response.dump();
}

// -----------------------------------------------------------------------------
// dispatch(): one branch per op; returns the op-specific reply fields
// -----------------------------------------------------------------------------
json SaleEngine::dispatch(const json& request) {
  const std::string op = codec::stringField(request, "op");
  json reply = json::object();

  auto caller = [&] { return codec::stringField(request, "caller"); };
  auto index = [&] { return codec::uintField(request, "index"); };
  auto referral = [&] {
    return codec::stringField(request, "referral_code", "");
  };
  auto saleReply = [&](SaleIndex i) {
    reply["sale"] =
        codec::toJson(toRecord(registry_.get(i), registry_.saleAddress()));
  };

  if (op == "ping") {
    reply["response"] = "pong";
  } else if (op == "status") {
    const auto payment = settings_.snapshot();
    reply["owner"] = access_.owner();
    reply["sale_address"] = registry_.saleAddress();
    reply["sale_count"] = registry_.count();
    reply["stablecoin_a"] = payment.stablecoin_a;
    reply["stablecoin_b"] = payment.stablecoin_b;
    reply["price_oracle"] = payment.price_oracle;
    reply["now"] = clock_.now_s();
  } else if (op == "get_sale") {
    saleReply(index());
  } else if (op == "list_sales") {
    json list = json::array();
    for (const auto& s : registry_.sales()) {
      list.push_back(codec::toJson(toRecord(s, registry_.saleAddress())));
    }
    reply["sales"] = std::move(list);
  } else if (op == "create_sale") {
    const SaleIndex i = createSale(caller(), codec::saleParamsFromJson(request));
    reply["index"] = i;
    saleReply(i);
  } else if (op == "set_price") {
    setPrice(caller(), index(), codec::amountField(request, "value"));
    saleReply(index());
  } else if (op == "set_max_tokens") {
    setMaxTokens(caller(), index(), codec::amountField(request, "value"));
    saleReply(index());
  } else if (op == "set_start_date") {
    setStartDate(caller(), index(), codec::uintField(request, "value"));
    saleReply(index());
  } else if (op == "set_end_date") {
    setEndDate(caller(), index(), codec::uintField(request, "value"));
    saleReply(index());
  } else if (op == "set_asset_address") {
    setAssetAddress(caller(), index(), codec::stringField(request, "value"));
    saleReply(index());
  } else if (op == "set_paused") {
    setPaused(caller(), index(), codec::boolField(request, "value"));
    saleReply(index());
  } else if (op == "set_stablecoin") {
    const std::string slot = codec::stringField(request, "slot");
    if (slot != "A" && slot != "B") {
      throw ValidationError("slot must be \"A\" or \"B\"");
    }
    setStablecoin(caller(), slot == "A" ? StableSlot::A : StableSlot::B,
                  codec::stringField(request, "address"));
  } else if (op == "set_price_oracle") {
    setPriceOracle(caller(), codec::stringField(request, "address"));
  } else if (op == "transfer_ownership") {
    transferOwnership(caller(), codec::stringField(request, "new_owner"));
    reply["owner"] = access_.owner();
  } else if (op == "withdraw_foreign_asset") {
    withdrawForeignAsset(caller(), codec::stringField(request, "asset"),
                         codec::amountField(request, "amount"));
  } else if (op == "withdraw_native_balance") {
    reply["amount"] = domain::formatAmount(withdrawNativeBalance(caller()));
  } else if (op == "buy_with_stablecoin_a") {
    reply["purchase"] = codec::toJson(Event{buyWithStablecoinA(
        caller(), index(), codec::amountField(request, "amount"), referral())});
  } else if (op == "buy_with_stablecoin_b") {
    reply["purchase"] = codec::toJson(Event{buyWithStablecoinB(
        caller(), index(), codec::amountField(request, "amount"), referral())});
  } else if (op == "buy_with_native") {
    reply["purchase"] = codec::toJson(Event{buyWithNative(
        caller(), index(), codec::amountField(request, "native_sent"),
        referral())});
  } else if (op == "token_approve") {
    // Simulation helper: caller grants spender an allowance on token.
    const std::string token_address = codec::stringField(request, "token");
    auto token = directory_.token(token_address);
    if (!token) {
      throw NotFoundError("no token registered at '" + token_address + "'");
    }
    ReentrancyGuard::Scope scope(guard_, "token_approve");
    const std::string spender =
        codec::stringField(request, "spender", registry_.saleAddress());
    if (!token->approve(caller(), spender,
                        codec::amountField(request, "amount"))) {
      throw ValidationError("approve rejected");
    }
  } else if (op == "token_balance") {
    const std::string token_address = codec::stringField(request, "token");
    auto token = directory_.token(token_address);
    if (!token) {
      throw NotFoundError("no token registered at '" + token_address + "'");
    }
    reply["balance"] = domain::formatAmount(
        token->balanceOf(codec::stringField(request, "account")));
  } else if (op == "native_balance") {
    auto bank = directory_.nativeBank();
    if (!bank) {
      throw NotFoundError("no native currency bank configured");
    }
    reply["balance"] = domain::formatAmount(
        bank->balanceOf(codec::stringField(request, "account")));
  } else {
    throw ValidationError("Unknown command: " + op);
  }

  return reply;
}

}  // namespace tokensale
