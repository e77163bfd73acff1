#ifndef CINEMA_SEED_DATA_HPP_
#define CINEMA_SEED_DATA_HPP_

namespace cinema {

class CinemaEngine;

/**
 * Loads a small demo catalogue (three films, three auditoriums, four
 * accounts, three screenings with bookings and payments) through the
 * engine's components. Skipped when any film already exists.
 *
 * Returns true when data was written.
 */
bool seedDemoData(CinemaEngine& engine);

}  // namespace cinema

#endif  // CINEMA_SEED_DATA_HPP_
