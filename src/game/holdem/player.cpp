#include "game/holdem/player.hpp"

#include "game/game_types.hpp"

#include <cassert>
#include <optional>
#include <string>

Player::Player(const std::string& name, int chips) :
    m_name{ name },
    m_chips{ chips },
    m_status{ chips > 0 ? SeatStatus::Active : SeatStatus::SittingOut } {
    assert(chips >= 0);
}

Status Player::commit(int amount) {
    assert(amount >= 0);

    if (amount > m_chips) {
        return EngineError{
            ErrorKind::InsufficientChips,
            m_name + " cannot commit " + std::to_string(amount) + " chips with a stack of " + std::to_string(m_chips) + "."
        };
    }

    m_chips -= amount;
    m_streetContribution += amount;
    m_handContribution += amount;
    if (m_chips == 0 && m_status == SeatStatus::Active) {
        m_status = SeatStatus::AllIn;
    }
    return Success{};
}

void Player::fold() {
    assert(m_status == SeatStatus::Active);
    m_status = SeatStatus::Folded;
}

void Player::collect(int amount) {
    assert(amount >= 0);
    m_chips += amount;
}

void Player::dealHoleCards(const HoleCards& holeCards) {
    assert(isInHand());
    m_holeCards = holeCards;
}

void Player::setSittingOut(bool sittingOut) {
    m_wantsToSitOut = sittingOut;
}

void Player::resetForNewHand() {
    m_streetContribution = 0;
    m_handContribution = 0;
    m_holeCards.reset();
    m_status = (m_chips > 0 && !m_wantsToSitOut) ? SeatStatus::Active : SeatStatus::SittingOut;
}

void Player::resetStreetContribution() {
    m_streetContribution = 0;
}

const std::string& Player::getName() const {
    return m_name;
}

int Player::getChips() const {
    return m_chips;
}

int Player::getStreetContribution() const {
    return m_streetContribution;
}

int Player::getHandContribution() const {
    return m_handContribution;
}

SeatStatus Player::getStatus() const {
    return m_status;
}

const std::optional<HoleCards>& Player::getHoleCards() const {
    return m_holeCards;
}

bool Player::isInHand() const {
    return m_status == SeatStatus::Active || m_status == SeatStatus::AllIn;
}

bool Player::wantsToSitOut() const {
    return m_wantsToSitOut;
}
