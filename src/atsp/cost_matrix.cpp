#include <cost_matrix.hpp>
#include <atsp_errors.hpp>
#include <cstdlib>
#include <string>
#include <utility>

const node_id CostMatrix::depot = 0;

/**
 * Berechnet die Kostenmatrix zu den gegebenen Bildern. Alle Bilder müssen die gleiche Größe haben.
 */
CostMatrix::CostMatrix(const ImageSequence& images) {
	const std::vector<Image>& imgs = images.getImages();
	if (imgs.empty()) {
		throw InvalidInputError("At least one image is required");
	}
	for (size_t i = 1; i < imgs.size(); ++i) {
		if (!imgs[i].hasSameSize(imgs[0])) {
			throw InvalidInputError("Image " + std::to_string(i + 1) + " has size " +
									std::to_string(imgs[i].getWidth()) + "x" + std::to_string(imgs[i].getHeight()) +
									", but image 1 has size " + std::to_string(imgs[0].getWidth()) + "x" +
									std::to_string(imgs[0].getHeight()));
		}
	}
	const size_t nodeCount = imgs.size() + 1;
	//Zeile und Spalte des Depots bleiben 0
	costs.assign(nodeCount, std::vector<cost_t>(nodeCount, 0));
	for (size_t from = 1; from < nodeCount; ++from) {
		for (size_t to = 1; to < nodeCount; ++to) {
			if (from != to) {
				costs[from][to] = seamCost(imgs[from - 1], imgs[to - 1]);
			}
		}
	}
}

/**
 * Übernimmt explizit gegebene Kosten. Die Zeilen werden hier nicht geprüft, das passiert erst beim Aufstellen des LPs.
 */
CostMatrix::CostMatrix(std::vector<std::vector<cost_t>> rows) : costs(std::move(rows)) {}

/**
 * Die Kosten, das Bild right direkt rechts neben das Bild left zu setzen: Summe der Farbabstände zwischen dem rechten
 * Rand von left und dem linken Rand von right
 */
cost_t CostMatrix::seamCost(const Image& left, const Image& right) {
	cost_t distance = 0;
	for (int row = 0; row < left.getHeight(); ++row) {
		const Pixel& a = left.getRightEdge(row);
		const Pixel& b = right.getLeftEdge(row);
		for (int color = 0; color < Pixel::channelCount; ++color) {
			distance += std::abs(a[color] - b[color]);
		}
	}
	return distance;
}

const std::vector<std::vector<cost_t>>& CostMatrix::getRows() const {
	return costs;
}

/**
 * Gibt die Kosten zwischen je zwei Objekten in beide Richtungen aus
 */
void CostMatrix::write(std::ostream& out) const {
	for (node_id i = 1; i < getNodeCount(); ++i) {
		for (node_id j = i + 1; j < getNodeCount(); ++j) {
			out << "Cost between object " << i << " and " << j << " is " << getCost(i, j)
				<< ", reverse is " << getCost(j, i) << "\n";
		}
	}
}
