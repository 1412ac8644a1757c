#include "core/session.hpp"

#include <utility>

namespace noughts {

Session::Session(SessionId id, PlayerInfo playerX, PlayerInfo playerO)
    : m_id(std::move(id)), m_participants{Participant{std::move(playerX), Symbol::X}, Participant{std::move(playerO), Symbol::O}} {
}

const SessionId& Session::id() const {
	return m_id;
}

const Participant& Session::playerX() const {
	return m_participants[0];
}

const Participant& Session::playerO() const {
	return m_participants[1];
}

std::optional<Participant> Session::participant(PlayerId playerId) const {
	for (const auto& entry: m_participants) {
		if (entry.player.id == playerId) {
			return entry;
		}
	}
	return std::nullopt;
}

bool Session::isParticipant(PlayerId playerId) const {
	return participant(playerId).has_value();
}

MoveResult Session::submitMove(PlayerId requester, Coord c) {
	const auto mover = participant(requester);

	std::lock_guard<std::mutex> lock(m_mutex);

	if (!mover || m_status != GameStatus::InProgress || mover->symbol != m_turn) {
		return {.error = MoveError::NotYourTurn, .snapshot = snapshotLocked()};
	}
	if (const auto error = checkPlacement(m_board, c); error != MoveError::None) {
		return {.error = error, .snapshot = snapshotLocked()};
	}
	if (!m_board.place(c, toCell(mover->symbol))) {
		return {.error = MoveError::CellOccupied, .snapshot = snapshotLocked()};
	}
	++m_moveNumber;

	const auto evaluation = evaluate(m_board);
	switch (evaluation.outcome) {
	case Outcome::Won:
		m_status = GameStatus::Won;
		m_winner = evaluation.winner;
		break;
	case Outcome::Draw:
		m_status = GameStatus::Draw;
		break;
	case Outcome::Ongoing:
		m_turn = opponent(m_turn);
		break;
	}

	return {.error = MoveError::None, .snapshot = snapshotLocked()};
}

std::optional<ChatLine> Session::chat(PlayerId sender, std::string text) const {
	const auto entry = participant(sender);
	if (!entry) {
		return std::nullopt;
	}

	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_terminated) {
		return std::nullopt;
	}
	return ChatLine{.sender = *entry, .text = std::move(text)};
}

std::optional<TerminateResult> Session::terminate(PlayerId requester, TerminateReason) {
	const auto leaver = participant(requester);
	if (!leaver) {
		return std::nullopt;
	}

	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_terminated) {
		return std::nullopt;
	}
	m_terminated = true;

	const auto statusBefore = m_status;
	if (m_status == GameStatus::InProgress) {
		m_status = GameStatus::Abandoned;
	}

	return TerminateResult{
	        .leaver       = *leaver,
	        .survivor     = bySymbol(opponent(leaver->symbol)),
	        .statusBefore = statusBefore,
	};
}

SessionSnapshot Session::snapshot() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return snapshotLocked();
}

bool Session::isTerminated() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_terminated;
}

SessionSnapshot Session::snapshotLocked() const {
	SessionSnapshot snapshot{
	        .id         = m_id,
	        .board      = m_board,
	        .status     = m_status,
	        .moveNumber = m_moveNumber,
	        .next       = std::nullopt,
	        .winner     = std::nullopt,
	};
	if (m_status == GameStatus::InProgress) {
		snapshot.next = bySymbol(m_turn);
	}
	if (m_status == GameStatus::Won && m_winner) {
		snapshot.winner = bySymbol(*m_winner);
	}
	return snapshot;
}

const Participant& Session::bySymbol(Symbol symbol) const {
	return symbol == Symbol::X ? m_participants[0] : m_participants[1];
}

} // namespace noughts
