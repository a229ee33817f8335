#ifndef WHAM_OUTPUT_H
#define WHAM_OUTPUT_H

#include <string>
#include <vector>


// One point of the free energy surface printed by wham-2d
struct WhamOutputRow
{
	double x, y;  // CV values
	double e;     // free energy
	double pro;   // probability
};


// Free energy surface produced by the WHAM solver
// - Only points with finite free energies are kept: the solver prints +/-inf
//   (or nan) for regions that were never sampled
class WhamOutput
{
 public:
	using Row = WhamOutputRow;

	WhamOutput() = default;

	// From rows with finite free energies
	WhamOutput(const std::vector<Row>& rows);

	// Reads a file with columns "x y e pro" and one header line
	// - Blank lines and later lines starting with '#' are skipped
	// - Throws MissingFileError if the file can't be opened, and ParseError
	//   if a line does not hold exactly 4 numbers (with finite x and y)
	static WhamOutput FromFile(const std::string& file_name);

	const std::vector<Row>& getRows() const noexcept {
		return rows_;
	}

	std::size_t size() const noexcept {
		return rows_.size();
	}

	bool empty() const noexcept {
		return rows_.empty();
	}

	// Number of unsampled points (non-finite free energy) that were dropped
	int getNumUnsampled() const noexcept {
		return num_unsampled_;
	}

 private:
	std::vector<Row> rows_;
	int num_unsampled_ = 0;
};

#endif // ifndef WHAM_OUTPUT_H
