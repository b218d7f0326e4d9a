#ifndef GAME_UTILS_HPP
#define GAME_UTILS_HPP

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <vector>

// CardID functions
Value getCardValue(CardID cardID);
Suit getCardSuit(CardID cardID);
CardID getCardID(Value value, Suit suit);
bool isRedCard(CardID cardID);
std::string getNameFromCardID(CardID cardID);
std::string getDisplayNameFromCardID(CardID cardID);
Result<CardID> getCardIDFromName(const std::string& cardName);
Result<std::vector<CardID>> getCardIDsFromNames(const std::vector<std::string>& cardNames);

// CardSet functions
CardSet cardIDToSet(CardID cardID);
int getSetSize(CardSet cardSet);
bool setContainsCard(CardSet cardSet, CardID cardID);
CardID getLowestCardInSet(CardSet cardSet);
CardID popLowestCardFromSet(CardSet& cardSet);
Result<CardSet> buildCardSet(std::span<const CardID> cards);

// Street and phase functions
Street nextStreet(Street street);
HandPhase getPhaseForStreet(Street street);

// Names for display
std::string getStreetName(Street street);
std::string getPhaseName(HandPhase phase);
std::string getSeatStatusName(SeatStatus status);
std::string getHandCategoryName(HandCategory category);
std::string getErrorKindName(ErrorKind kind);

#endif // GAME_UTILS_HPP
