//
// Created by dylan on 3/3/26.
//

#include "LineModel.h"
#include <cmath>

#include "TMatrixD.h"
#include "TPrincipal.h"

TVector3 centroid(const std::vector<TVector3>& points)
{
    TVector3 sum(0, 0, 0);
    if (points.empty()) return sum;
    for (const TVector3& p : points) sum += p;
    return (1.0 / points.size()) * sum;
}

LineModel principalAxis(const std::vector<TVector3>& points)
{
    LineModel line;
    line.origin = centroid(points);
    if (points.size() < 2) return line;

    bool spread = false;
    for (const TVector3& p : points) {
        if ((p - line.origin).Mag2() > 0) {
            spread = true;
            break;
        }
    }
    if (!spread) return line;

    // Covariance is accumulated as the rows are added, no data is stored and
    // the variables are not normalised.
    TPrincipal pca(3, "");
    for (const TVector3& p : points) {
        double row[3];
        (p - line.origin).GetXYZ(row);
        pca.AddRow(row);
    }
    pca.MakePrincipals();

    const TMatrixD* eigenVectors = pca.GetEigenVectors();
    TVector3 axis((*eigenVectors)(0, 0), (*eigenVectors)(1, 0), (*eigenVectors)(2, 0));
    if (axis.Mag2() <= 0) return line;
    axis = axis.Unit();

    // Fix the sign: largest magnitude component positive.
    int largest = 0;
    for (int i = 1; i < 3; ++i)
        if (std::fabs(axis[i]) > std::fabs(axis[largest])) largest = i;
    if (axis[largest] < 0) axis = -axis;

    line.direction = axis;
    return line;
}

LineModel fitLine(const std::vector<TVector3>& points)
{
    if (points.size() == 2) {
        LineModel line;
        TVector3 delta = points[1] - points[0];
        line.origin = points[0];
        if (delta.Mag2() > 0) line.direction = delta.Unit();
        return line;
    }
    return principalAxis(points);
}
