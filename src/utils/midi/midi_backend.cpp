#include "midi_backend.hpp"

int MidiBackend::score_device(const QString &name)
{
	const QString s = name.toLower();
	int score = 0;
	if (s.contains("midi in"))
		score += 100;
	if (s.contains("through"))
		score -= 100;
	else
		score += 10;
	if (s.contains("usb") || s.contains("controller") || s.contains("keyboard"))
		score += 5;
	return score;
}

int MidiBackend::pick_device(const QStringList &devices, const QString &query,
							 bool *query_matched)
{
	if (query_matched)
		*query_matched = true;
	if (devices.isEmpty())
		return -1;

	const QString q = query.trimmed();
	if (!q.isEmpty()) {
		for (int i = 0; i < devices.size(); i++) {
			if (devices[i].contains(q, Qt::CaseInsensitive))
				return i;
		}
		if (query_matched)
			*query_matched = false;
		return 0;
	}

	int best = 0;
	int best_score = score_device(devices[0]);
	for (int i = 1; i < devices.size(); i++) {
		const int sc = score_device(devices[i]);
		if (sc > best_score) {
			best_score = sc;
			best = i;
		}
	}
	return best;
}
