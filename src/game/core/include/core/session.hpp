#pragma once

#include "core/rules.hpp"
#include "model/board.hpp"
#include "model/gameStatus.hpp"
#include "model/player.hpp"
#include "model/symbol.hpp"

#include <array>
#include <mutex>
#include <optional>
#include <string>

namespace noughts {

//! A player bound to a session and a symbol.
struct Participant {
	PlayerInfo player;
	Symbol symbol;
};

//! Copy of the session state taken inside the session's critical section.
struct SessionSnapshot {
	SessionId id;
	Board board;
	GameStatus status{GameStatus::InProgress};
	unsigned moveNumber{0u};           //!< Number of accepted moves. Lets clients drop stale updates.
	std::optional<Participant> next;   //!< Participant holding the turn. Empty once terminal.
	std::optional<Participant> winner; //!< Set for GameStatus::Won.
};

struct MoveResult {
	MoveError error{MoveError::None};
	SessionSnapshot snapshot; //!< State after the request. Unchanged state on rejection.

	bool accepted() const {
		return error == MoveError::None;
	}
};

struct ChatLine {
	Participant sender;
	std::string text;
};

enum class TerminateReason { Quit, Disconnect };

struct TerminateResult {
	Participant leaver;
	Participant survivor;    //!< Participant that has to be told about the departure.
	GameStatus statusBefore; //!< Status when the session was torn down.
};

//! One game between two participants.
//! Board, turn and status are guarded by a per-session mutex. Participants never change after construction.
//! \note No method performs I/O. Callers broadcast the returned copies after the lock is released.
class Session {
public:
	Session(SessionId id, PlayerInfo playerX, PlayerInfo playerO);

	Session(const Session&)            = delete;
	Session& operator=(const Session&) = delete;
	Session(Session&&)                 = delete;
	Session& operator=(Session&&)      = delete;

	const SessionId& id() const;
	const Participant& playerX() const;
	const Participant& playerO() const;

	std::optional<Participant> participant(PlayerId playerId) const; //!< Participant entry of a player. Empty if not part of this session.
	bool isParticipant(PlayerId playerId) const;

	//! Validate and apply a move. Concurrent requests are decided by lock acquisition order.
	MoveResult submitMove(PlayerId requester, Coord c);

	//! Relay chat. Empty if sender is no participant or the session was torn down.
	std::optional<ChatLine> chat(PlayerId sender, std::string text) const;

	//! Single teardown entry point for quit and disconnect.
	//! Marks an in-progress game abandoned. Returns a value for the first call only, so the survivor is notified once.
	std::optional<TerminateResult> terminate(PlayerId requester, TerminateReason reason);

	SessionSnapshot snapshot() const;
	bool isTerminated() const; //!< True once a participant left.

private:
	SessionSnapshot snapshotLocked() const; //!< Requires m_mutex.
	const Participant& bySymbol(Symbol symbol) const;

private:
	const SessionId m_id;
	const std::array<Participant, 2> m_participants; //!< X first, O second.

	mutable std::mutex m_mutex;
	Board m_board;
	Symbol m_turn{Symbol::X};
	GameStatus m_status{GameStatus::InProgress};
	std::optional<Symbol> m_winner;
	unsigned m_moveNumber{0u};
	bool m_terminated{false};
};

} // namespace noughts
